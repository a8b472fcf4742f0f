#pragma once

#include <mutex>
#include <string>
#include <unordered_set>

#include "common.hpp"
#include "sqlite.hpp"
#include "task_source.hpp"

// Merges the remote task list into the local store. Both passes go through one
// gate, so at most one of them touches the store at a time, whatever thread
// triggered it. A pass that waited on the gate fetches its own fresh snapshot.
class Reconciler {
  public:
    Reconciler(SQLite &db, TaskSource &source);

    bool IsConfigured() const;

    // Imports unknown remote tasks, mirrors completion flags and deletes local
    // tasks whose remote counterpart is gone.
    SyncResult ReconcileFull();

    // Imports remote tasks whose id is not in known. Status changes and deletions
    // are left to ReconcileFull.
    DetectResult DetectAndImportNew(const std::unordered_set<std::string> &known);

  private:
    void ImportRemoteTask(const RemoteTask &remote);

    SQLite &m_Db;
    TaskSource &m_Source;
    std::mutex m_PassMutex;
};
