#pragma once
#include <stdexcept>
#include <string>

class TransitError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Requested city is not configured, or its id is not usable as a file name.
class UnknownCityError : public TransitError
{
public:
    using TransitError::TransitError;
};

// Network failure, timeout or non-2xx response.
class FetchError : public TransitError
{
public:
    using TransitError::TransitError;
};

// Import asked for a city whose archive was never downloaded.
class ArchiveNotFoundError : public TransitError
{
public:
    using TransitError::TransitError;
};

class ParseError : public TransitError
{
public:
    using TransitError::TransitError;
};

class StoreError : public TransitError
{
public:
    using TransitError::TransitError;
};
