#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "notification.hpp"
#include "secrets.hpp"
#include "task_source.hpp"

// Scripted remote provider.
class FakeTaskSource : public TaskSource {
  public:
    bool IsConfigured() const override {
        return m_Configured.load();
    }

    std::vector<RemoteTask> FetchTasks() override {
        m_Fetches++;
        if (m_Delay.count() > 0) {
            std::this_thread::sleep_for(m_Delay);
        }
        if (m_Fail.load()) {
            throw TaskSourceError("simulated outage");
        }
        std::lock_guard<std::mutex> lock(m_Mutex);
        return m_Snapshot;
    }

    void SetSnapshot(std::vector<RemoteTask> snapshot) {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Snapshot = std::move(snapshot);
    }
    void SetConfigured(bool configured) {
        m_Configured = configured;
    }
    void SetFailing(bool fail) {
        m_Fail = fail;
    }
    void SetDelay(std::chrono::milliseconds delay) {
        m_Delay = delay;
    }
    int Fetches() const {
        return m_Fetches.load();
    }

  private:
    std::mutex m_Mutex;
    std::vector<RemoteTask> m_Snapshot;
    std::atomic<bool> m_Configured{true};
    std::atomic<bool> m_Fail{false};
    std::atomic<int> m_Fetches{0};
    std::chrono::milliseconds m_Delay{0};
};

// In-memory token store that counts how it was used.
class MemoryTokenStore : public TokenStore {
  public:
    bool SaveToken(const std::string &token) override {
        m_Saves++;
        m_Token = token;
        return true;
    }
    std::optional<std::string> LoadToken() override {
        return m_Token;
    }
    bool ClearToken() override {
        m_Clears++;
        m_Token.reset();
        return true;
    }

    int Saves() const {
        return m_Saves;
    }
    int Clears() const {
        return m_Clears;
    }

  private:
    std::optional<std::string> m_Token;
    int m_Saves = 0;
    int m_Clears = 0;
};

struct RecordedNotification {
    std::string title;
    std::string body;
    nlohmann::json data;
};

class RecordingNotifier : public Notifier {
  public:
    void Notify(const std::string &title, const std::string &body,
                const nlohmann::json &data) override {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Items.push_back({title, body, data});
    }

    std::vector<RecordedNotification> Items() const {
        std::lock_guard<std::mutex> lock(m_Mutex);
        return m_Items;
    }
    size_t Count() const {
        std::lock_guard<std::mutex> lock(m_Mutex);
        return m_Items.size();
    }

  private:
    mutable std::mutex m_Mutex;
    std::vector<RecordedNotification> m_Items;
};

inline RemoteTask MakeRemote(const std::string &id, const std::string &title, bool completed = false,
                             const std::string &description = "") {
    RemoteTask task;
    task.id = id;
    task.title = title;
    task.completed = completed;
    task.description = description;
    task.created_at = "2024-01-02T10:00:00";
    return task;
}

// Polls cond until it holds or timeout expires.
template <typename Cond>
bool WaitFor(Cond cond, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (cond()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return cond();
}
