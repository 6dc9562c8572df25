#include "TrafficLogger.hpp"

#include <sstream>
#include <chrono>
#include <string_view>
#include <fmt/format.h>

#include "../config/Config.hpp"
#include "../debug/log.hpp"
#include "../helpers/UrlUtils.hpp"

CTrafficLogger::CTrafficLogger() {
    if (!g_pConfig || !g_pConfig->m_config.logging.log_traffic)
        return;

    const auto& SCHEMA = g_pConfig->m_config.logging.traffic_log_schema;

    size_t      begin = 0;
    while (begin <= SCHEMA.size()) {
        const auto             COMMA = SCHEMA.find(',', begin);
        const std::string_view CURR  = std::string_view{SCHEMA}.substr(begin, COMMA == std::string::npos ? std::string::npos : COMMA - begin);

        if (CURR == "epoch")
            m_logSchema.emplace_back(TRAFFIC_EPOCH);
        else if (CURR == "destination")
            m_logSchema.emplace_back(TRAFFIC_DESTINATION);
        else if (CURR == "resource")
            m_logSchema.emplace_back(TRAFFIC_RESOURCE);
        else if (CURR == "useragent")
            m_logSchema.emplace_back(TRAFFIC_USERAGENT);
        else if (CURR == "status")
            m_logSchema.emplace_back(TRAFFIC_STATUS);
        else if (CURR == "action")
            m_logSchema.emplace_back(TRAFFIC_ACTION);
        else if (!CURR.empty())
            Debug::log(WARN, "TrafficLogger: unknown schema column \"{}\", skipping", CURR);

        if (COMMA == std::string::npos)
            break;

        begin = COMMA + 1;
    }

    m_file.open(g_pConfig->m_config.logging.traffic_log_file, std::ios::app);

    if (!m_file.good())
        Debug::die("TrafficLogger: bad file {}", g_pConfig->m_config.logging.traffic_log_file);
}

CTrafficLogger::~CTrafficLogger() {
    if (m_file.is_open())
        m_file.close();
}

static std::string sanitize(const std::string& s) {
    if (s.empty())
        return s;

    std::string cpy = s;
    size_t      pos = 0;
    while ((pos = cpy.find('"', pos)) != std::string::npos) {
        cpy.replace(pos, 1, "\\\"");
        pos += 2;
    }

    return cpy;
}

static const char* actionToString(eTrafficAction a) {
    switch (a) {
        case TRAFFIC_ACTION_PASS: return "PASS";
        case TRAFFIC_ACTION_CHALLENGE: return "CHALLENGE";
        case TRAFFIC_ACTION_SOLVED: return "SOLVED";
        case TRAFFIC_ACTION_FAILED: return "FAILED";
    }

    return "ERROR";
}

void CTrafficLogger::logTraffic(const SHttpRequest& req, int status, eTrafficAction actionTaken) {
    if (!m_file.is_open())
        return;

    const auto        URL = NUrlUtils::parse(req.url);

    std::stringstream ss;

    for (const auto& t : m_logSchema) {
        switch (t) {
            case TRAFFIC_EPOCH: {
                ss << fmt::format("{},", std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count());
                break;
            }

            case TRAFFIC_DESTINATION: {
                ss << fmt::format("\"{}\",", sanitize(URL ? NUrlUtils::destination(*URL) : req.url));
                break;
            }

            case TRAFFIC_RESOURCE: {
                ss << fmt::format("\"{}\",", sanitize(URL ? URL->path : ""));
                break;
            }

            case TRAFFIC_USERAGENT: {
                const auto UA = req.headers.get("User-Agent");
                if (!UA) {
                    ss << "\"<no data>\",";
                    break;
                }
                ss << fmt::format("\"{}\",", sanitize(*UA));
                break;
            }

            case TRAFFIC_STATUS: {
                ss << fmt::format("{},", status);
                break;
            }

            case TRAFFIC_ACTION: {
                ss << fmt::format("{},", actionToString(actionTaken));
                break;
            }
        }
    }

    std::string trafficLine = ss.str();
    if (trafficLine.empty())
        return;

    // replace , with \n
    trafficLine.back() = '\n';

    std::lock_guard<std::mutex> lg(m_fileMutex);
    m_file << trafficLine;
    m_file.flush();
}
