// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe - SnmpSession

#include "core/SnmpSession.hpp"
#include "core/Errors.hpp"
#include "core/FieldAccessor.hpp"
#include "utils/StringUtils.hpp"

#include <net-snmp/net-snmp-config.h>
#include <net-snmp/net-snmp-includes.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>

namespace Sentry::Core {

    namespace {
        using PduPtr = std::unique_ptr<netsnmp_pdu, decltype(&snmp_free_pdu)>;

        void initLibrary() {
            static bool initialized = false;
            if (initialized) return;

            // Minden OID numerikus: se MIB betöltés, se perzisztens állapot
            setenv("MIBS", "", 1);
            netsnmp_ds_set_boolean(NETSNMP_DS_LIBRARY_ID, NETSNMP_DS_LIB_DONT_PERSIST_STATE, 1);
            init_snmp("check_ups");
            initialized = true;
        }

        std::string takeErrorString(char* errstr) {
            std::string message = errstr ? errstr : "unknown error";
            std::free(errstr);
            return message;
        }

        std::vector<oid> toOidArray(const std::string& text) {
            auto parsed = parseObjectId(text);
            if (!parsed.ok()) {
                throw DataError("cannot request '" + text + "': " + parsed.reason);
            }

            std::vector<oid> arcs;
            for (const auto& arc : SentryUtils::split(*parsed.value, '.')) {
                arcs.push_back(static_cast<oid>(std::stoul(arc)));
            }
            if (arcs.size() > MAX_OID_LEN) {
                throw DataError("identifier too long: " + text);
            }
            return arcs;
        }

        std::string fromOidArray(const oid* arcs, size_t length) {
            std::string out;
            for (size_t i = 0; i < length; ++i) {
                if (i > 0) out += '.';
                out += std::to_string(arcs[i]);
            }
            return out;
        }

        // A változó értékének szöveges alakja; noSuch*/endOfMibView -> nullopt
        std::optional<std::string> renderValue(const netsnmp_variable_list* var) {
            switch (var->type) {
                case ASN_INTEGER:
                    return std::to_string(*var->val.integer);
                case ASN_COUNTER:
                case ASN_GAUGE:
                case ASN_TIMETICKS:
                case ASN_UINTEGER:
                    return std::to_string(static_cast<unsigned long>(*var->val.integer) & 0xffffffffUL);
                case ASN_COUNTER64: {
                    unsigned long long high = var->val.counter64->high & 0xffffffffUL;
                    unsigned long long low = var->val.counter64->low & 0xffffffffUL;
                    return std::to_string((high << 32) | low);
                }
                case ASN_OCTET_STR:
                    return std::string(reinterpret_cast<const char*>(var->val.string), var->val_len);
                case ASN_OBJECT_ID:
                    return fromOidArray(var->val.objid, var->val_len / sizeof(oid));
                case ASN_IPADDRESS: {
                    const u_char* ip = var->val.string;
                    return std::to_string(ip[0]) + "." + std::to_string(ip[1]) + "."
                           + std::to_string(ip[2]) + "." + std::to_string(ip[3]);
                }
                default:
                    // SNMP_NOSUCHOBJECT, SNMP_NOSUCHINSTANCE, SNMP_ENDOFMIBVIEW, NULL
                    return std::nullopt;
            }
        }

        void configureUsm(netsnmp_session& session, const SnmpSettings& settings) {
            session.version = SNMP_VERSION_3;
            session.securityName = const_cast<char*>(settings.username.c_str());
            session.securityNameLen = settings.username.size();

            if (settings.authPassword.empty()) {
                session.securityLevel = SNMP_SEC_LEVEL_NOAUTH;
                return;
            }

            if (SentryUtils::toLower(settings.authProtocol) == "sha") {
                session.securityAuthProto = usmHMACSHA1AuthProtocol;
                session.securityAuthProtoLen = USM_AUTH_PROTO_SHA_LEN;
            } else {
                session.securityAuthProto = usmHMACMD5AuthProtocol;
                session.securityAuthProtoLen = USM_AUTH_PROTO_MD5_LEN;
            }

            session.securityAuthKeyLen = USM_AUTH_KU_LEN;
            if (generate_Ku(session.securityAuthProto,
                            static_cast<u_int>(session.securityAuthProtoLen),
                            reinterpret_cast<const u_char*>(settings.authPassword.c_str()),
                            settings.authPassword.size(),
                            session.securityAuthKey,
                            &session.securityAuthKeyLen) != SNMPERR_SUCCESS) {
                throw DataError("cannot derive SNMPv3 authentication key");
            }

            if (settings.privPassword.empty()) {
                session.securityLevel = SNMP_SEC_LEVEL_AUTHNOPRIV;
                return;
            }

            session.securityLevel = SNMP_SEC_LEVEL_AUTHPRIV;
            if (SentryUtils::toLower(settings.privProtocol) == "aes") {
                session.securityPrivProto = usmAESPrivProtocol;
                session.securityPrivProtoLen = USM_PRIV_PROTO_AES_LEN;
            } else {
                session.securityPrivProto = usmDESPrivProtocol;
                session.securityPrivProtoLen = USM_PRIV_PROTO_DES_LEN;
            }

            session.securityPrivKeyLen = USM_PRIV_KU_LEN;
            if (generate_Ku(session.securityAuthProto,
                            static_cast<u_int>(session.securityAuthProtoLen),
                            reinterpret_cast<const u_char*>(settings.privPassword.c_str()),
                            settings.privPassword.size(),
                            session.securityPrivKey,
                            &session.securityPrivKeyLen) != SNMPERR_SUCCESS) {
                throw DataError("cannot derive SNMPv3 privacy key");
            }
        }
    }

    SnmpSession::SnmpSession(const SnmpSettings& settings, LogLevel level)
        : handle(nullptr), peer(settings.hostname + ":" + std::to_string(settings.port)),
          legacyV1(settings.version == SnmpVersion::V1), currentLogLevel(level) {

        initLibrary();

        netsnmp_session session;
        snmp_sess_init(&session);

        // snmp_sess_open() lemásolja a mutatott mezőket
        session.peername = const_cast<char*>(peer.c_str());
        session.timeout = static_cast<long>(settings.timeoutSeconds) * 1000000L;
        session.retries = settings.retries;

        switch (settings.version) {
            case SnmpVersion::V1:
            case SnmpVersion::V2C:
                session.version = (settings.version == SnmpVersion::V1) ? SNMP_VERSION_1 : SNMP_VERSION_2c;
                session.community = reinterpret_cast<u_char*>(const_cast<char*>(settings.community.c_str()));
                session.community_len = settings.community.size();
                break;
            case SnmpVersion::V3:
                configureUsm(session, settings);
                break;
        }

        handle = snmp_sess_open(&session);
        if (handle == nullptr) {
            int libError = 0;
            int sysError = 0;
            char* errstr = nullptr;
            snmp_error(&session, &libError, &sysError, &errstr);
            throw DataError("cannot open SNMP session to " + peer + ": " + takeErrorString(errstr));
        }

        if (currentLogLevel != LogLevel::SILENT) {
            std::cerr << "[SnmpSession] Session opened: " << peer << std::endl;
        }
    }

    SnmpSession::~SnmpSession() {
        if (handle != nullptr) {
            snmp_sess_close(handle);
            handle = nullptr;
        }
    }

    std::string SnmpSession::lastError() const {
        int libError = 0;
        int sysError = 0;
        char* errstr = nullptr;
        snmp_sess_error(handle, &libError, &sysError, &errstr);
        return takeErrorString(errstr);
    }

    ValueMap SnmpSession::fetch(const std::vector<std::string>& oids) {
        ValueMap result;
        if (oids.empty()) return result;

        PduPtr request(snmp_pdu_create(SNMP_MSG_GET), &snmp_free_pdu);
        for (const auto& text : oids) {
            auto arcs = toOidArray(text);
            snmp_add_null_var(request.get(), arcs.data(), arcs.size());
        }

        if (currentLogLevel == LogLevel::DEBUG) {
            std::cerr << "[SnmpSession] GET " << oids.size() << " OIDs from " << peer << std::endl;
        }

        while (request) {
            netsnmp_pdu* raw = nullptr;
            // A kérést a könyvtár minden esetben felszabadítja
            int status = snmp_sess_synch_response(handle, request.release(), &raw);
            PduPtr response(raw, &snmp_free_pdu);

            if (status == STAT_TIMEOUT) {
                throw DataError("no response from " + peer + " (timeout)");
            }
            if (status != STAT_SUCCESS || !response) {
                throw DataError("SNMP request to " + peer + " failed: " + lastError());
            }

            if (response->errstat == SNMP_ERR_NOERROR) {
                for (auto* var = response->variables; var != nullptr; var = var->next_variable) {
                    auto value = renderValue(var);
                    std::string name = fromOidArray(var->name, var->name_length);
                    if (value) {
                        result.emplace(name, *value);
                    } else if (currentLogLevel == LogLevel::DEBUG) {
                        std::cerr << "[SnmpSession] No such object: " << name << std::endl;
                    }
                }
                break;
            }

            // SNMPv1: egy hiányzó OID az egész választ elrontja, kivesszük és újrakérjük
            if (legacyV1 && response->errstat == SNMP_ERR_NOSUCHNAME) {
                if (currentLogLevel == LogLevel::DEBUG) {
                    std::cerr << "[SnmpSession] noSuchName at index " << response->errindex
                              << ", retrying without it" << std::endl;
                }
                request.reset(snmp_fix_pdu(response.get(), SNMP_MSG_GET));
                continue;
            }

            throw DataError("SNMP error from " + peer + ": " + snmp_errstring(static_cast<int>(response->errstat)));
        }

        return result;
    }

} // namespace Sentry::Core
