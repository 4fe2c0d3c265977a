#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace auth
{

struct Registration
{
    std::string user_id;
    std::string access_token;
};

/**
 * Host server's account persistence as seen by the LDAP provider.
 * Threepids are keyed by (medium, address); medium is "email" or "msisdn".
 */
class AccountStore
{
public:
    virtual ~AccountStore() = default;

    [[nodiscard]] virtual bool user_exists(std::string_view user_id) = 0;
    [[nodiscard]] virtual std::expected<Registration, std::string> register_user(std::string_view localpart) = 0;
    [[nodiscard]] virtual bool set_display_name(std::string_view localpart, std::string_view name) = 0;
    [[nodiscard]] virtual std::optional<std::string> get_user_id_by_threepid(std::string_view medium,
                                                                             std::string_view address) = 0;
    [[nodiscard]] virtual bool add_threepid(std::string_view user_id,
                                            std::string_view medium,
                                            std::string_view address,
                                            int64_t validated_at,
                                            int64_t added_at) = 0;
    [[nodiscard]] virtual int64_t now_ms() = 0;
};

}
