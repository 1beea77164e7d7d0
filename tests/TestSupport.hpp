#pragma once
#include <atomic>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <gtest/gtest.h>
#include "miniz.h"

using FeedFiles = std::vector<std::pair<std::string, std::string>>;

// Scratch directory removed with everything in it when the test ends.
class TempDir
{
public:
    TempDir()
    {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path = std::filesystem::temp_directory_path()
             / ("stopboard_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path);
    }

    ~TempDir()
    {
        std::error_code ignore;
        std::filesystem::remove_all(path, ignore);
    }

    TempDir(TempDir const&) = delete;
    TempDir& operator=(TempDir const&) = delete;

    std::filesystem::path const& get() const { return path; }
    std::filesystem::path operator/(std::string const& name) const { return path / name; }

private:
    std::filesystem::path path;
};

inline void writeZip(std::filesystem::path const& zipPath, FeedFiles const& files)
{
    for (auto const& [name, content] : files)
    {
        mz_bool ok = mz_zip_add_mem_to_archive_file_in_place(
            zipPath.string().c_str(), name.c_str(),
            content.data(), content.size(),
            nullptr, 0, MZ_DEFAULT_COMPRESSION);
        ASSERT_TRUE(ok) << "could not add " << name << " to " << zipPath;
    }
}

inline void writeFile(std::filesystem::path const& path, std::string const& content)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string readFile(std::filesystem::path const& path)
{
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Small Pafos-like feed. S5 has broken coordinates, so the third stop of T2
// is rejected by the stop foreign key; S6 and S7 carry zero coordinates; HOL
// only appears in calendar_dates and trips and needs a placeholder calendar.
inline FeedFiles sampleFeed()
{
    return {
        {"agency.txt",
         "agency_id,agency_name,agency_url,agency_timezone\n"
         "OSYPA,OSYPA Pafos,https://example.cy,Europe/Nicosia\n"},
        {"stops.txt",
         "stop_id,stop_code,stop_name,stop_lat,stop_lon\n"
         "S1,101,Harbour,34.75,32.41\n"
         "S2,102,Market,34.76,32.42\n"
         "S3,103,Kato Paphos,34.77,32.43\n"
         "S4,104,Depot,,\n"
         "S5,105,Broken,abc,32.0\n"
         "S6,106,Zero Island,0,0\n"
         "S7,107,Meridian,0,33.0\n"},
        {"routes.txt",
         "route_id,agency_id,route_short_name,route_long_name,route_type,route_color,route_text_color\n"
         "R1,OSYPA,611,Harbour - Market,3,FF0000,FFFFFF\n"
         "R2,OSYPA,\xCE\x91" "1,Airport Express,x,,\n"},
        {"calendar.txt",
         "service_id,monday,tuesday,wednesday,thursday,friday,saturday,sunday,start_date,end_date\n"
         "WK,1,1,1,1,1,0,0,20240101,20241231\n"},
        {"calendar_dates.txt",
         "service_id,date,exception_type\n"
         "WK,20240501,2\n"
         "HOL,20241225,1\n"},
        {"trips.txt",
         "route_id,service_id,trip_id,trip_headsign,direction_id\n"
         "R1,WK,T1,Market,0\n"
         "R2,HOL,T2,Airport,1\n"},
        {"stop_times.txt",
         "trip_id,arrival_time,departure_time,stop_id,stop_sequence\r\n"
         "T1,08:00:00,08:00:00,S1,1\r\n"
         "T1,08:10:00,08:10:00,S2,2\r\n"
         "T1,08:20:00,08:20:00,S3,3\r\n"
         "T2,25:10:00,25:10:00,S2,1\r\n"
         "T2,25:30:00,25:30:00,S3,2\r\n"
         "T2,25:40:00,25:40:00,S5,3\r\n"},
        {"shapes.txt",
         "shape_id,shape_pt_lat,shape_pt_lon,shape_pt_sequence\n"
         "SH1,34.75,32.41,1\n"
         "SH1,34.76,32.42,2\n"
         "SH1,north,32.43,3\n"},
        {"fare_attributes.txt",
         "fare_id,price,currency_type,payment_method,transfers\n"
         "F1,1.50,EUR,0,\n"},
        {"fare_rules.txt",
         "fare_id,route_id\n"
         "F1,R1\n"},
    };
}

// 2024-01-01 23:55:00 in Cyprus (UTC+2).
constexpr std::time_t LOCAL_2355 = 1704067200 + 21 * 3600 + 55 * 60;

// Plain HTTP server on 127.0.0.1 with canned replies, running on its own
// thread. Unknown targets get 404.
class LocalHttpServer
{
public:
    struct Reply
    {
        unsigned status = 200;
        std::string body;
        std::string location;
        bool hang = false;
    };

    explicit LocalHttpServer(std::map<std::string, Reply> replies)
        : routes(std::move(replies))
        , acceptor(io, {boost::asio::ip::make_address("127.0.0.1"), 0})
    {
        boost::asio::co_spawn(io, acceptLoop(), boost::asio::detached);
        runner = std::thread([this] { io.run(); });
    }

    ~LocalHttpServer()
    {
        io.stop();
        runner.join();
    }

    LocalHttpServer(LocalHttpServer const&) = delete;
    LocalHttpServer& operator=(LocalHttpServer const&) = delete;

    std::string url(std::string const& target) const
    {
        return "http://127.0.0.1:" + std::to_string(acceptor.local_endpoint().port()) + target;
    }

    std::vector<std::string> requestedTargets()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return targets;
    }

private:
    std::map<std::string, Reply> routes;
    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor acceptor;
    std::mutex mutex;
    std::vector<std::string> targets;
    std::thread runner;

    boost::asio::awaitable<void> acceptLoop()
    {
        for (;;)
        {
            boost::asio::ip::tcp::socket socket = co_await acceptor.async_accept(boost::asio::use_awaitable);
            boost::asio::co_spawn(io, serve(std::move(socket)), boost::asio::detached);
        }
    }

    boost::asio::awaitable<void> serve(boost::asio::ip::tcp::socket socket)
    {
        boost::beast::flat_buffer buffer;
        boost::beast::http::request<boost::beast::http::string_body> request;
        co_await boost::beast::http::async_read(socket, buffer, request, boost::asio::use_awaitable);

        std::string target(request.target());
        {
            std::lock_guard<std::mutex> lock(mutex);
            targets.push_back(target);
        }

        Reply reply;
        reply.status = 404;
        auto found = routes.find(target);
        if (found != routes.end())
            reply = found->second;

        if (reply.hang)
        {
            boost::asio::steady_timer never(socket.get_executor());
            never.expires_after(std::chrono::hours(1));
            co_await never.async_wait(boost::asio::use_awaitable);
            co_return;
        }

        boost::beast::http::response<boost::beast::http::string_body> response;
        response.version(11);
        response.result(reply.status);
        if (!reply.location.empty())
            response.set(boost::beast::http::field::location, reply.location);
        response.body() = reply.body;
        response.prepare_payload();
        co_await boost::beast::http::async_write(socket, response, boost::asio::use_awaitable);

        boost::system::error_code ignore;
        socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignore);
    }
};

using ServerReplies = std::map<std::string, LocalHttpServer::Reply>;
