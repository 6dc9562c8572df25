#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <memory>
#include <mutex>
#include <fstream>

#include "../core/HttpMessage.hpp"

enum eTrafficAction : uint8_t {
    TRAFFIC_ACTION_PASS = 0, // not a challenge
    TRAFFIC_ACTION_CHALLENGE,
    TRAFFIC_ACTION_SOLVED,
    TRAFFIC_ACTION_FAILED,
};

class CTrafficLogger {
  public:
    CTrafficLogger();
    ~CTrafficLogger();

    void logTraffic(const SHttpRequest& req, int status, eTrafficAction actionTaken);

  private:
    enum eTrafficLoggerProps : uint8_t {
        TRAFFIC_EPOCH = 0,
        TRAFFIC_DESTINATION,
        TRAFFIC_RESOURCE,
        TRAFFIC_USERAGENT,
        TRAFFIC_STATUS,
        TRAFFIC_ACTION,
    };

    std::vector<eTrafficLoggerProps> m_logSchema;
    std::ofstream                    m_file;
    std::mutex                       m_fileMutex;
};

inline std::unique_ptr<CTrafficLogger> g_pTrafficLogger;
