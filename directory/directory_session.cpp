#include "directory/directory_session.hpp"
#include "logger/logger.hpp"

namespace directory
{

namespace {

void unbind_quietly(DirectoryConnection& conn, std::string_view dn) noexcept
{
    try
    {
        conn.unbind();
    }
    catch (const DirectoryError& e)
    {
        LOG_WARN("LDAP unbind for {} failed: {}", dn, e.what());
    }
}

}

std::expected<DirectorySession, Failure> DirectorySession::bind(DirectoryClient& client,
                                                                std::string_view uri,
                                                                std::string_view bind_dn,
                                                                std::string_view secret,
                                                                bool start_tls)
{
    std::unique_ptr<DirectoryConnection> conn;
    try
    {
        conn = client.connect(uri, bind_dn, secret);
        LOG_DEBUG("LDAP connection with {} for {}", uri, bind_dn);

        if (start_tls)
        {
            conn->open();
            conn->start_tls();
            LOG_DEBUG("Upgraded LDAP connection for {} through StartTLS", bind_dn);
        }

        if (conn->bind())
        {
            LOG_DEBUG("LDAP bind successful for {}", bind_dn);
            return DirectorySession(std::move(conn), std::string(bind_dn));
        }

        auto reason = conn->last_result();
        LOG_INFO("LDAP bind for {} failed: {}", bind_dn, reason);
        unbind_quietly(*conn, bind_dn);
        return std::unexpected(Failure{Failure::Kind::Rejected, std::move(reason)});
    }
    catch (const DirectoryError& e)
    {
        LOG_WARN("LDAP authentication error for {}: {}", bind_dn, e.what());
        if (conn)
        {
            unbind_quietly(*conn, bind_dn);
        }
        return std::unexpected(Failure{Failure::Kind::ProtocolError, e.what()});
    }
}

DirectorySession::DirectorySession(std::unique_ptr<DirectoryConnection> c, std::string bound)
    : conn(std::move(c))
    , dn(std::move(bound))
{
}

DirectorySession::~DirectorySession()
{
    close();
}

DirectorySession::DirectorySession(DirectorySession&& other) noexcept
    : conn(std::move(other.conn))
    , dn(std::move(other.dn))
{
}

DirectorySession& DirectorySession::operator=(DirectorySession&& other) noexcept
{
    if (this != &other)
    {
        close();
        conn = std::move(other.conn);
        dn = std::move(other.dn);
    }
    return *this;
}

void DirectorySession::close() noexcept
{
    if (conn)
    {
        unbind_quietly(*conn, dn);
        conn.reset();
    }
}

}
