#include "common/job.hpp"
#include "common/logger.hpp"
#include <chrono>
#include <random>
#include <sstream>
#include <iomanip>

Job::Job() : id_(generateId()), state_(State::Idle) {}

void Job::setError(const std::string& error) {
    error_ = error;
}

void Job::setState(State state) {
    if (state == state_) {
        return;
    }
    Logger::debug("Job " + id_ + ": " + stateToString(state_) + " -> " + stateToString(state));
    state_ = state;
}

const char* Job::stateToString(State state) {
    switch (state) {
        case State::Idle:                  return "Idle";
        case State::ValidatingEnvironment: return "ValidatingEnvironment";
        case State::CollectingExisting:    return "CollectingExisting";
        case State::Archiving:             return "Archiving";
        case State::Transferring:          return "Transferring";
        case State::Done:                  return "Done";
        case State::Failed:                return "Failed";
        default:                           return "Unknown";
    }
}

std::string Job::generateId() const {
    auto now = std::chrono::system_clock::now();
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch());

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);
    const char* hex = "0123456789abcdef";

    std::stringstream ss;
    ss << std::hex << now_ms.count();
    for (int i = 0; i < 8; ++i) {
        ss << hex[dis(gen)];
    }

    return ss.str();
}
