#pragma once

#include "directory/directory_client.hpp"

#include <chrono>

namespace directory
{

/**
 * DirectoryClient backed by OpenLDAP's libldap (LDAPv3, simple bind, subtree search).
 * The timeout applies both to establishing the TCP connection and to each operation.
 */
class OpenLdapClient final : public DirectoryClient
{
public:
    explicit OpenLdapClient(std::chrono::seconds timeout);

    [[nodiscard]] std::unique_ptr<DirectoryConnection> connect(std::string_view uri,
                                                               std::string_view bind_dn,
                                                               std::string_view secret) override;

private:
    std::chrono::seconds op_timeout;
};

}
