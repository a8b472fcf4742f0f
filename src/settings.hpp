#pragma once

#include <mutex>
#include <string>

// Runtime configuration that the admin routes may change while the schedulers run.
class Settings {
  public:
    std::string GetTodoistToken() const {
        std::lock_guard<std::mutex> lock(m_Mutex);
        return m_TodoistToken;
    }
    void SetTodoistToken(const std::string &token) {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_TodoistToken = token;
    }
    bool HasTodoistToken() const {
        std::lock_guard<std::mutex> lock(m_Mutex);
        return !m_TodoistToken.empty();
    }

    std::string GetTodoistProjectId() const {
        std::lock_guard<std::mutex> lock(m_Mutex);
        return m_TodoistProjectId;
    }
    void SetTodoistProjectId(const std::string &projectId) {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_TodoistProjectId = projectId;
    }

  private:
    mutable std::mutex m_Mutex;
    std::string m_TodoistToken;
    std::string m_TodoistProjectId;
};
