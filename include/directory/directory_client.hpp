#pragma once

#include <boost/algorithm/string/predicate.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace directory
{

// Transport or protocol failure reported by a directory client.
class DirectoryError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Attribute names are case-insensitive in LDAP.
using AttributeValues = std::map<std::string, std::vector<std::string>, boost::algorithm::is_iless>;

struct SearchResponse
{
    enum class Kind : uint8_t
    {
        Entry,
        Reference,
        Other,
    };

    Kind kind = Kind::Other;
    std::string dn;
    AttributeValues attributes;
};

/**
 * One connection to a directory server, created with the credentials it will bind with.
 * Operations throw DirectoryError on transport or protocol failure.
 */
class DirectoryConnection
{
public:
    virtual ~DirectoryConnection() = default;

    virtual void open() = 0;
    virtual void start_tls() = 0;
    // false when the server refused the credentials.
    [[nodiscard]] virtual bool bind() = 0;
    [[nodiscard]] virtual std::vector<SearchResponse> search(std::string_view base,
                                                             std::string_view filter,
                                                             const std::vector<std::string>& attributes) = 0;
    virtual void unbind() = 0;
    [[nodiscard]] virtual std::string last_result() const = 0;
};

class DirectoryClient
{
public:
    virtual ~DirectoryClient() = default;

    [[nodiscard]] virtual std::unique_ptr<DirectoryConnection> connect(std::string_view uri,
                                                                       std::string_view bind_dn,
                                                                       std::string_view secret) = 0;
};

struct Failure
{
    enum class Kind : uint8_t
    {
        Rejected,
        ProtocolError,
    };

    Kind kind;
    std::string reason;
};

}
