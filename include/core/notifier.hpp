#pragma once

#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Outbound user notification
 *
 * Called once per job after it reaches completed or failed.
 */
class Notifier
{
public:
    virtual ~Notifier() = default;

    virtual void notify(const std::string &user_id, const std::string &event, const nlohmann::json &payload) = 0;
};

/**
 * @brief Notifier that writes events through the logger
 */
class LogNotifier : public Notifier
{
public:
    void notify(const std::string &user_id, const std::string &event, const nlohmann::json &payload) override;
};
