#include "auth/profile_reconciler.hpp"
#include "logger/logger.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>

namespace auth
{

ProfileReconciler::ProfileReconciler(AccountStore& s, Config::AttributeMap attributes, AuthMetrics& metrics)
    : store(s)
    , attrs(std::move(attributes))
    , mts(metrics)
{
}

std::expected<Identity, std::string> ProfileReconciler::reconcile(std::string_view user_id,
                                                                  std::string_view localpart,
                                                                  const directory::DirectoryEntry& entry)
{
    Identity identity;
    identity.user_id = std::string(user_id);
    identity.localpart = std::string(localpart);

    if (!store.get().user_exists(user_id))
    {
        auto reg = store.get().register_user(localpart);
        if (!reg)
        {
            LOG_ERROR("Registering {} for LDAP user failed: {}", localpart, reg.error());
            return std::unexpected(reg.error());
        }
        LOG_INFO("Registered new account {} for LDAP user {}", reg->user_id, localpart);
        identity.user_id = std::move(reg->user_id);
        identity.provisioned = true;
        mts.get().accounts_provisioned++;
    }

    if (auto name = entry.first(attrs.name); name && !name->empty())
    {
        if (store.get().set_display_name(localpart, *name))
        {
            identity.display_name = std::move(*name);
        }
        else
        {
            LOG_WARN("Updating display name of {} failed", identity.user_id);
        }
    }

    if (attrs.mail)
    {
        sync_threepids(identity, "email", entry.values(*attrs.mail), true, identity.emails);
    }
    if (attrs.msisdn)
    {
        sync_threepids(identity, "msisdn", entry.values(*attrs.msisdn), false, identity.msisdns);
    }

    return identity;
}

void ProfileReconciler::sync_threepids(const Identity& identity,
                                       std::string_view medium,
                                       const std::vector<std::string>& addresses,
                                       bool fold_case,
                                       std::vector<std::string>& owned)
{
    for (const auto& raw : addresses)
    {
        if (raw.empty())
        {
            continue;
        }
        std::string address = fold_case ? boost::algorithm::to_lower_copy(raw) : raw;

        auto owner = store.get().get_user_id_by_threepid(medium, address);
        if (!owner)
        {
            auto validated_at = store.get().now_ms();
            if (!store.get().add_threepid(identity.user_id, medium, address, validated_at, validated_at))
            {
                LOG_WARN("Attaching {} {} to {} failed", medium, address, identity.user_id);
                continue;
            }
            owned.push_back(std::move(address));
        }
        else if (!boost::algorithm::iequals(*owner, identity.user_id))
        {
            LOG_ERROR("Auth user {} with {} {} but user {} already has the same {}",
                      identity.user_id, medium, address, *owner, medium);
            mts.get().threepid_conflicts++;
        }
        else
        {
            owned.push_back(std::move(address));
        }
    }
}

}
