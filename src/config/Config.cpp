#include "Config.hpp"

#include <glaze/glaze.hpp>

#include "../helpers/FsUtils.hpp"
#include "../GlobalState.hpp"

#include "../debug/log.hpp"

CConfig::CConfig() {
    if (g_pGlobalState->configPath.empty()) {
        Debug::log(LOG, "No config given, using defaults");
        return;
    }

    const auto PATH = NFsUtils::isAbsolute(g_pGlobalState->configPath) ? g_pGlobalState->configPath : g_pGlobalState->cwd + "/" + g_pGlobalState->configPath;
    const auto RAW  = NFsUtils::readFileAsString(PATH);

    if (!RAW.has_value())
        Debug::die("Config {} could not be read: {}", PATH, RAW.error());

    auto json = glz::read_jsonc<SConfig>(RAW.value());

    if (!json.has_value())
        Debug::die("Config has bad format: {}", glz::format_error(json.error(), RAW.value()));

    m_config = json.value();

    if (m_config.client_threads < 1) {
        Debug::log(WARN, "client_threads must be at least 1, using 1");
        m_config.client_threads = 1;
    }

    if (m_config.max_redirects < 0)
        m_config.max_redirects = 0;

    if (m_config.logging.log_traffic && m_config.logging.traffic_log_file.empty())
        Debug::die("logging.log_traffic is set but logging.traffic_log_file is empty");
}
