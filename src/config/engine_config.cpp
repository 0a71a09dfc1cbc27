// ================================
// 配置文件 / 环境变量加载
// ================================

#include "invlens/config/engine_config.h"
#include "invlens/common/logger.h"
#include <cstdlib>
#include <fstream>

namespace invlens::config {

namespace {

std::string Trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

void SetFromEnv(EngineConfig* config, const char* env, const std::string& key) {
    const char* value = std::getenv(env);
    if (!value || !*value) {
        return;
    }
    auto res = config->set(key, value);
    if (res.hasError()) {
        LOG_WARN("Ignoring {}: {}", env, res.error().message());
    }
}

} // namespace

Result<Void> LoadConfigFile(const std::string& file, IConfig* config) {
    std::ifstream in(file);
    if (!in) {
        return Err<Void>(ErrorCode::kNotFound, "Cannot open config file: " + file);
    }

    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        auto text = Trim(line);
        if (text.empty() || text[0] == '#') {
            continue;
        }
        auto eq = text.find('=');
        if (eq == std::string::npos) {
            return Err<Void>(ErrorCode::kInvalidArgument,
                             file + ":" + std::to_string(lineno) + ": expected key = value");
        }
        auto key = Trim(text.substr(0, eq));
        auto value = Trim(text.substr(eq + 1));
        auto res = config->set(key, value);
        if (res.hasError()) {
            return Err<Void>(ErrorCode::kInvalidArgument,
                             file + ":" + std::to_string(lineno) + ": " + res.error().message());
        }
    }
    return Ok();
}

void ApplyEnvironment(EngineConfig* config) {
    SetFromEnv(config, "INVLENS_S3_ENDPOINT", "storage.endpoint");
    SetFromEnv(config, "INVLENS_S3_REGION", "storage.region");
    SetFromEnv(config, "AWS_ACCESS_KEY_ID", "storage.access_key");
    SetFromEnv(config, "AWS_SECRET_ACCESS_KEY", "storage.secret_key");
    SetFromEnv(config, "AWS_SESSION_TOKEN", "storage.session_token");
    SetFromEnv(config, "INVLENS_CACHE_DB", "cache.db_path");
    SetFromEnv(config, "INVLENS_LOG_LEVEL", "log.level");
}

} // namespace invlens::config
