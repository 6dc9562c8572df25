#pragma once

#include <string>
#include <memory>

constexpr const char* DEFAULT_USER_AGENT = "Mozilla/5.0 (Windows NT 10.0; WOW64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/65.0.3325.181 Safari/537.36";

class CConfig {
  public:
    // reads g_pGlobalState->configPath, defaults when there is none
    CConfig();

    struct SConfig {
        std::string       user_agent                = DEFAULT_USER_AGENT;
        unsigned long int challenge_delay_ms        = 5000; // cloudflare rejects answers that come in faster
        unsigned long int evaluation_timeout_ms     = 5000;
        bool              strict_verification_token = true;
        unsigned long int transport_timeout_sec     = 120; // 2 minutes
        unsigned long int max_response_size         = 10000000; // 10MB
        int               client_threads            = 4;
        int               max_redirects             = 5;
        bool              trace_logging             = false;

        struct {
            bool        log_traffic = false;
            std::string traffic_log_schema;
            std::string traffic_log_file;
        } logging;
    } m_config;
};

inline std::unique_ptr<CConfig> g_pConfig;
