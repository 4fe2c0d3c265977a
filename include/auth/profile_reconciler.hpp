#pragma once

#include "auth/account_store.hpp"
#include "config.hpp"
#include "directory/search_resolver.hpp"
#include "logger/metrics.hpp"

#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace auth
{

struct Identity
{
    std::string user_id;
    std::string localpart;
    std::optional<std::string> display_name;
    std::vector<std::string> emails;
    std::vector<std::string> msisdns;
    bool provisioned = false;
};

/**
 * Copies directory attributes onto the local account, creating the account first if needed.
 * Display name is overwritten. Threepids are only attached when nobody owns them yet;
 * another account's threepid is never taken over.
 */
class ProfileReconciler
{
public:
    ProfileReconciler(AccountStore& store, Config::AttributeMap attributes, AuthMetrics& metrics);

    [[nodiscard]] std::expected<Identity, std::string> reconcile(std::string_view user_id,
                                                                 std::string_view localpart,
                                                                 const directory::DirectoryEntry& entry);

private:
    void sync_threepids(const Identity& identity,
                        std::string_view medium,
                        const std::vector<std::string>& addresses,
                        bool fold_case,
                        std::vector<std::string>& owned);

    std::reference_wrapper<AccountStore> store;
    Config::AttributeMap attrs;
    std::reference_wrapper<AuthMetrics> mts;
};

}
