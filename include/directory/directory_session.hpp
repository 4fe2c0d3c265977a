#pragma once

#include "directory/directory_client.hpp"

#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace directory
{

/**
 * A bound directory connection. Owning the session means owning the bind:
 * the connection is unbound when the session is closed or destroyed.
 */
class DirectorySession
{
public:
    // Connects, upgrades through StartTLS when asked (before binding) and binds.
    // Never throws for directory failures; they come back as a Failure.
    [[nodiscard]] static std::expected<DirectorySession, Failure> bind(DirectoryClient& client,
                                                                       std::string_view uri,
                                                                       std::string_view bind_dn,
                                                                       std::string_view secret,
                                                                       bool start_tls);
    ~DirectorySession();

    DirectorySession(const DirectorySession&) = delete;
    DirectorySession& operator=(const DirectorySession&) = delete;
    DirectorySession(DirectorySession&& other) noexcept;
    DirectorySession& operator=(DirectorySession&& other) noexcept;

    [[nodiscard]] DirectoryConnection& connection() { return *conn; }
    [[nodiscard]] std::string_view bound_dn() const { return dn; }
    [[nodiscard]] bool is_open() const { return conn != nullptr; }

    void close() noexcept;

private:
    DirectorySession(std::unique_ptr<DirectoryConnection> conn, std::string dn);

    std::unique_ptr<DirectoryConnection> conn;
    std::string dn;
};

}
