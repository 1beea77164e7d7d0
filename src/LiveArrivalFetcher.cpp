#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <cstdio>
#include <iostream>
#include <regex>
#include <set>
#include "Errors.hpp"
#include "LiveArrivalFetcher.hpp"
#include "Parser.hpp"
#include "TimeNormalizer.hpp"

namespace
{
const std::string ITEM_CLASS  = "arrivalTimes__list__item";
const std::string LABEL_CLASS = "line__item__text";
const std::string TIME_CLASS  = "arrivalTimes__list__item__link__text2";

// The operator's "no live estimate, scheduled time only" text, with and
// without the misspelling the site has shipped.
const std::string PLACEHOLDERS[] = {
    "Προβλεπόενη ώρα σύμφων με το χρονοδιάγραμμα",
    "Προβλεπόμενη ώρα σύμφωνα με το χρονοδιάγραμμα",
};

const std::set<std::string> VOID_ELEMENTS = {
    "area", "base", "br", "col", "embed", "hr", "img", "input",
    "link", "meta", "param", "source", "track", "wbr"
};

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::set<std::string> classTokens(std::string const& attributes)
{
    static const std::regex re(R"re((?:^|\s)class\s*=\s*(?:"([^"]*)"|'([^']*)'|([^\s"'>/]+)))re", std::regex::icase);

    std::set<std::string> tokens;
    std::smatch m;
    if (!std::regex_search(attributes, m, re))
        return tokens;

    std::string value = m[1].matched ? m[1].str() : m[2].matched ? m[2].str() : m[3].str();
    std::size_t i = 0;
    while (i < value.size())
    {
        while (i < value.size() && std::isspace(static_cast<unsigned char>(value[i]))) ++i;
        std::size_t start = i;
        while (i < value.size() && !std::isspace(static_cast<unsigned char>(value[i]))) ++i;
        if (i > start) tokens.insert(value.substr(start, i - start));
    }
    return tokens;
}

void appendUtf8(std::string& out, unsigned long cp)
{
    if (cp == 0 || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        cp = 0xFFFD;

    if (cp < 0x80)
    {
        out += static_cast<char>(cp);
    }
    else if (cp < 0x800)
    {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else if (cp < 0x10000)
    {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else
    {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

struct OpenElement
{
    std::string name;
    bool item  = false;
    bool label = false;
    bool time  = false;
};

enum class Capture
{
    Pending,
    Active,
    Done
};
}

LiveArrivalFetcher::LiveArrivalFetcher(HttpClient& c, ConfigurationManager const& cfg, std::function<std::time_t()> now)
    : client(c)
    , config(cfg)
    , clock(std::move(now))
{
    if (!clock)
        clock = [] { return std::time(nullptr); };
}

boost::asio::awaitable<std::vector<LiveArrival>> LiveArrivalFetcher::fetch(std::string stopId)
{
    std::string url = config.getLiveArrivalsBaseUrl() + "/" + percentEncode(stopId);

    HttpResponse response;
    bool ok = false;
    try
    {
        response = co_await client.get(url, config.getLiveTimeout());
        ok = true;
    }
    catch (std::exception const& e)
    {
        std::cerr << "[Live] Error fetching arrivals for stop " << stopId << ": " << e.what() << "\n";
    }

    if (!ok)
        co_return std::vector<LiveArrival>{};

    if (response.status < 200 || response.status >= 300)
    {
        std::cerr << "[Live] Stop " << stopId << ": HTTP " << response.status << "\n";
        co_return std::vector<LiveArrival>{};
    }

    co_return parsePage(response.body, clock());
}

std::vector<LiveArrival> LiveArrivalFetcher::parsePage(std::string_view html, std::time_t now)
{
    std::vector<LiveArrival> arrivals;

    for (RawEntry const& entry : extractEntries(html))
    {
        std::string label = routeLabel(entry.label);
        if (label.empty() || entry.timeText.empty() || isPlaceholder(entry.timeText))
            continue;

        std::time_t arrival = 0;
        int minutes = 0;

        try
        {
            auto word = entry.timeText.find(MINUTES_WORD);
            if (word != std::string::npos)
            {
                std::string count = entry.timeText;
                count.erase(word, MINUTES_WORD.size());
                auto n = Parser::parseInt(trimText(count));
                if (!n)
                    continue;
                minutes = *n;
                arrival = now + static_cast<std::time_t>(minutes) * 60;
            }
            else
            {
                std::string clock = entry.timeText;
                if (std::count(clock.begin(), clock.end(), ':') == 1)
                    clock += ":00";

                arrival = TimeNormalizer::parseGtfsTime(clock, now);
                if (arrival < now)
                    arrival = TimeNormalizer::parseGtfsTime(clock, now + TimeNormalizer::SECONDS_PER_DAY);

                minutes = static_cast<int>(std::lround(static_cast<double>(arrival - now) / 60.0));
            }
        }
        catch (ParseError const& e)
        {
            std::cerr << "[Live] Unreadable arrival time '" << entry.timeText << "': " << e.what() << "\n";
            continue;
        }

        if (minutes < 0)
            continue;

        LiveArrival live;
        live.routeLabel = label;
        live.arrivalTime = TimeNormalizer::formatGtfsTime(arrival);
        live.minutesUntil = minutes;
        arrivals.push_back(std::move(live));
    }

    return arrivals;
}

// Tag-level walk over the page. Each item element opens an entry; within it
// the first label element and the first time element collect the text of
// their subtrees.
std::vector<LiveArrivalFetcher::RawEntry> LiveArrivalFetcher::extractEntries(std::string_view html)
{
    static const std::regex tagRe(R"(<(/?)([A-Za-z][A-Za-z0-9]*)\b([^>]*)>)");

    std::vector<RawEntry> entries;
    std::vector<OpenElement> stack;

    bool inItem = false;
    Capture label = Capture::Pending;
    Capture time = Capture::Pending;
    RawEntry current;

    auto finishItem = [&]()
    {
        entries.push_back(current);
        current = RawEntry{};
        inItem = false;
        label = Capture::Pending;
        time = Capture::Pending;
    };

    auto appendText = [&](std::string_view raw)
    {
        if (!inItem || (label != Capture::Active && time != Capture::Active))
            return;
        std::string text = trimText(decodeEntities(raw));
        if (label == Capture::Active) current.label += text;
        if (time == Capture::Active) current.timeText += text;
    };

    auto popElement = [&]()
    {
        OpenElement const& top = stack.back();
        if (top.label && label == Capture::Active) label = Capture::Done;
        if (top.time && time == Capture::Active) time = Capture::Done;
        bool closesItem = top.item;
        stack.pop_back();
        if (closesItem) finishItem();
    };

    std::size_t pos = 0;
    while (pos < html.size())
    {
        std::size_t open = html.find('<', pos);
        if (open == std::string_view::npos)
        {
            appendText(html.substr(pos));
            break;
        }
        appendText(html.substr(pos, open - pos));

        if (html.compare(open, 4, "<!--") == 0)
        {
            std::size_t end = html.find("-->", open + 4);
            pos = end == std::string_view::npos ? html.size() : end + 3;
            continue;
        }

        std::size_t close = html.find('>', open);
        if (close == std::string_view::npos)
        {
            appendText(html.substr(open));
            break;
        }
        pos = close + 1;

        std::string tag(html.substr(open, close - open + 1));
        std::smatch m;
        if (!std::regex_match(tag, m, tagRe))
            continue;

        bool closing = m[1].length() > 0;
        std::string name = lower(m[2].str());
        std::string attributes = m[3].str();

        if (closing)
        {
            auto match = std::find_if(stack.rbegin(), stack.rend(), [&](OpenElement const& e) { return e.name == name; });
            if (match == stack.rend())
                continue;
            std::size_t depth = static_cast<std::size_t>(stack.rend() - match);
            while (stack.size() >= depth)
                popElement();
            continue;
        }

        bool selfClosing = !attributes.empty() && attributes.back() == '/';
        if (selfClosing || VOID_ELEMENTS.count(name))
            continue;

        std::set<std::string> classes = classTokens(attributes);

        OpenElement element;
        element.name = name;
        if (!inItem && classes.count(ITEM_CLASS))
        {
            element.item = true;
            inItem = true;
        }
        else if (inItem)
        {
            if (label == Capture::Pending && classes.count(LABEL_CLASS))
            {
                element.label = true;
                label = Capture::Active;
            }
            if (time == Capture::Pending && classes.count(TIME_CLASS))
            {
                element.time = true;
                time = Capture::Active;
            }
        }
        stack.push_back(element);
    }

    if (inItem)
        finishItem();

    return entries;
}

std::string LiveArrivalFetcher::routeLabel(std::string const& text)
{
    return trimText(text.substr(0, text.find(ROUTE_WORD)));
}

bool LiveArrivalFetcher::isPlaceholder(std::string const& timeText)
{
    return std::find(std::begin(PLACEHOLDERS), std::end(PLACEHOLDERS), timeText) != std::end(PLACEHOLDERS);
}

std::string LiveArrivalFetcher::decodeEntities(std::string_view text)
{
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size())
    {
        if (text[i] != '&')
        {
            out += text[i++];
            continue;
        }

        std::size_t semi = text.find(';', i);
        if (semi == std::string_view::npos || semi - i > 10)
        {
            out += text[i++];
            continue;
        }

        std::string_view name = text.substr(i + 1, semi - i - 1);
        bool known = true;
        if (name == "amp")        out += '&';
        else if (name == "lt")    out += '<';
        else if (name == "gt")    out += '>';
        else if (name == "quot")  out += '"';
        else if (name == "apos")  out += '\'';
        else if (name == "nbsp")  out += "\xC2\xA0";
        else if (name.size() > 1 && name[0] == '#')
        {
            bool hex = name[1] == 'x' || name[1] == 'X';
            std::string digits(name.substr(hex ? 2 : 1));
            char* end = nullptr;
            unsigned long cp = digits.empty() ? 0 : std::strtoul(digits.c_str(), &end, hex ? 16 : 10);
            if (digits.empty() || *end != '\0')
                known = false;
            else
                appendUtf8(out, cp);
        }
        else
        {
            known = false;
        }

        if (known)
        {
            i = semi + 1;
        }
        else
        {
            out += text[i++];
        }
    }
    return out;
}

std::string LiveArrivalFetcher::trimText(std::string const& text)
{
    static const std::string NBSP = "\xC2\xA0";
    auto isAsciiSpace = [](char c)
    {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    };

    std::size_t begin = 0;
    std::size_t end = text.size();

    while (begin < end)
    {
        if (isAsciiSpace(text[begin])) begin += 1;
        else if (text.compare(begin, 2, NBSP) == 0) begin += 2;
        else break;
    }
    while (end > begin)
    {
        if (isAsciiSpace(text[end - 1])) end -= 1;
        else if (end - begin >= 2 && text.compare(end - 2, 2, NBSP) == 0) end -= 2;
        else break;
    }
    return text.substr(begin, end - begin);
}

std::string LiveArrivalFetcher::percentEncode(std::string const& text)
{
    std::string out;
    for (unsigned char c : text)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
        {
            out += static_cast<char>(c);
        }
        else
        {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}
