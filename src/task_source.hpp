#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "common.hpp"

// Raised for any failure talking to the remote provider. Callers treat it as a
// skipped pass, never as fatal.
class TaskSourceError : public std::runtime_error {
  public:
    explicit TaskSourceError(const std::string &what) : std::runtime_error(what) {}
};

class TaskSource {
  public:
    virtual ~TaskSource() = default;

    // False when no credential is set; nothing should be fetched then.
    virtual bool IsConfigured() const = 0;

    // Full current snapshot of the remote list. Throws TaskSourceError.
    virtual std::vector<RemoteTask> FetchTasks() = 0;
};
