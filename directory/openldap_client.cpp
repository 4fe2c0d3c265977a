#include "directory/openldap_client.hpp"

#include <ldap.h>
#include <lber.h>

#include <format>
#include <sys/time.h>

namespace directory
{

namespace {

struct MessageDeleter
{
    void operator()(LDAPMessage* msg) const { ldap_msgfree(msg); }
};

using MessagePtr = std::unique_ptr<LDAPMessage, MessageDeleter>;

bool is_transport_error(int rc)
{
    return rc == LDAP_SERVER_DOWN
        || rc == LDAP_TIMEOUT
        || rc == LDAP_CONNECT_ERROR
        || rc == LDAP_LOCAL_ERROR
        || rc == LDAP_NO_MEMORY
        || rc == LDAP_UNAVAILABLE
        || rc == LDAP_BUSY;
}

class OpenLdapConnection final : public DirectoryConnection
{
public:
    OpenLdapConnection(std::string_view uri, std::string_view bind_dn, std::string_view secret,
                       std::chrono::seconds timeout)
        : dn(bind_dn)
        , password(secret)
        , timeout(timeout)
    {
        int rc = ldap_initialize(&ld, std::string(uri).c_str());
        if (rc != LDAP_SUCCESS || ld == nullptr)
        {
            throw DirectoryError(std::format("ldap_initialize({}) failed: {}", uri, ldap_err2string(rc)));
        }
    }

    ~OpenLdapConnection() override
    {
        if (ld)
        {
            ldap_unbind_ext_s(ld, nullptr, nullptr);
        }
    }

    OpenLdapConnection(const OpenLdapConnection&) = delete;
    OpenLdapConnection& operator=(const OpenLdapConnection&) = delete;

    // libldap dials lazily on the first request; open() only fixes the session options.
    void open() override
    {
        ensure_handle();
        if (opened)
        {
            return;
        }

        int version = LDAP_VERSION3;
        set_option(LDAP_OPT_PROTOCOL_VERSION, &version);
        set_option(LDAP_OPT_REFERRALS, LDAP_OPT_OFF);

        timeval tv{};
        tv.tv_sec = static_cast<time_t>(timeout.count());
        set_option(LDAP_OPT_NETWORK_TIMEOUT, &tv);
        set_option(LDAP_OPT_TIMEOUT, &tv);

        opened = true;
    }

    void start_tls() override
    {
        open();
        int rc = ldap_start_tls_s(ld, nullptr, nullptr);
        if (rc != LDAP_SUCCESS)
        {
            result = ldap_err2string(rc);
            throw DirectoryError(std::format("StartTLS failed: {}", result));
        }
    }

    bool bind() override
    {
        open();

        berval cred{};
        cred.bv_val = const_cast<char*>(password.c_str());
        cred.bv_len = password.size();

        int rc = ldap_sasl_bind_s(ld, dn.c_str(), LDAP_SASL_SIMPLE, &cred, nullptr, nullptr, nullptr);
        result = ldap_err2string(rc);
        if (rc == LDAP_SUCCESS)
        {
            return true;
        }
        if (is_transport_error(rc))
        {
            throw DirectoryError(std::format("bind as {} failed: {}", dn, result));
        }
        return false;
    }

    std::vector<SearchResponse> search(std::string_view base,
                                       std::string_view filter,
                                       const std::vector<std::string>& attributes) override
    {
        open();

        std::vector<char*> attrs;
        attrs.reserve(attributes.size() + 1);
        for (const auto& a : attributes)
        {
            attrs.push_back(const_cast<char*>(a.c_str()));
        }
        attrs.push_back(nullptr);

        timeval tv{};
        tv.tv_sec = static_cast<time_t>(timeout.count());

        LDAPMessage* raw = nullptr;
        int rc = ldap_search_ext_s(ld, std::string(base).c_str(), LDAP_SCOPE_SUBTREE,
                                   std::string(filter).c_str(),
                                   attributes.empty() ? nullptr : attrs.data(),
                                   0, nullptr, nullptr, &tv, LDAP_NO_LIMIT, &raw);
        MessagePtr res(raw);
        result = ldap_err2string(rc);
        if (rc != LDAP_SUCCESS)
        {
            throw DirectoryError(std::format("search under {} failed: {}", base, result));
        }

        std::vector<SearchResponse> responses;
        for (LDAPMessage* msg = ldap_first_message(ld, res.get()); msg; msg = ldap_next_message(ld, msg))
        {
            switch (ldap_msgtype(msg))
            {
                case LDAP_RES_SEARCH_ENTRY:
                    responses.push_back(read_entry(msg));
                    break;
                case LDAP_RES_SEARCH_REFERENCE:
                    responses.push_back(SearchResponse{SearchResponse::Kind::Reference, {}, {}});
                    break;
                default:
                    responses.push_back(SearchResponse{SearchResponse::Kind::Other, {}, {}});
                    break;
            }
        }
        return responses;
    }

    void unbind() override
    {
        if (!ld)
        {
            return;
        }
        int rc = ldap_unbind_ext_s(ld, nullptr, nullptr);
        ld = nullptr;
        if (rc != LDAP_SUCCESS)
        {
            result = ldap_err2string(rc);
            throw DirectoryError(std::format("unbind failed: {}", result));
        }
    }

    std::string last_result() const override { return result; }

private:
    void ensure_handle() const
    {
        if (!ld)
        {
            throw DirectoryError("connection already unbound");
        }
    }

    void set_option(int option, const void* value)
    {
        if (int rc = ldap_set_option(ld, option, value); rc != LDAP_OPT_SUCCESS)
        {
            throw DirectoryError(std::format("ldap_set_option({}) failed: {}", option, ldap_err2string(rc)));
        }
    }

    SearchResponse read_entry(LDAPMessage* msg)
    {
        SearchResponse entry;
        entry.kind = SearchResponse::Kind::Entry;

        if (char* entry_dn = ldap_get_dn(ld, msg); entry_dn)
        {
            entry.dn = entry_dn;
            ldap_memfree(entry_dn);
        }

        BerElement* ber = nullptr;
        for (char* attr = ldap_first_attribute(ld, msg, &ber); attr; attr = ldap_next_attribute(ld, msg, ber))
        {
            auto& values = entry.attributes[attr];
            if (berval** vals = ldap_get_values_len(ld, msg, attr); vals)
            {
                for (int i = 0; vals[i] != nullptr; ++i)
                {
                    values.emplace_back(vals[i]->bv_val, vals[i]->bv_len);
                }
                ldap_value_free_len(vals);
            }
            ldap_memfree(attr);
        }
        if (ber)
        {
            ber_free(ber, 0);
        }
        return entry;
    }

    LDAP* ld = nullptr;
    std::string dn;
    std::string password;
    std::chrono::seconds timeout;
    std::string result;
    bool opened = false;
};

}

OpenLdapClient::OpenLdapClient(std::chrono::seconds timeout)
    : op_timeout(timeout)
{
}

std::unique_ptr<DirectoryConnection> OpenLdapClient::connect(std::string_view uri,
                                                             std::string_view bind_dn,
                                                             std::string_view secret)
{
    return std::make_unique<OpenLdapConnection>(uri, bind_dn, secret, op_timeout);
}

}
