#pragma once

#include <string>

class Job {
public:
    enum class State {
        Idle,
        ValidatingEnvironment,
        CollectingExisting,
        Archiving,
        Transferring,
        Done,
        Failed
    };

    Job();
    virtual ~Job() = default;

    State getState() const { return state_; }
    std::string getError() const { return error_; }
    std::string getId() const { return id_; }

    static const char* stateToString(State state);

protected:
    void setError(const std::string& error);
    void setState(State state);
    std::string generateId() const;

    std::string id_;
    State state_{State::Idle};
    std::string error_;
};
