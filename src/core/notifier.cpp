#include "core/notifier.hpp"
#include "logging/logger.hpp"

void LogNotifier::notify(const std::string &user_id, const std::string &event, const nlohmann::json &payload)
{
    Logger::info("Notify user " + user_id + " [" + event + "] " + payload.dump());
}
