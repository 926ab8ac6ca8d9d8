// src/common/os/linux.h
#pragma once

// Cross-platform process table access for Linux/macOS/Windows.
#include <chrono>
#include <list>
#include <memory>
#include <string>
#include <vector>

#include <ace/OS_NS_unistd.h> // for pid_t

#include "models.h" // for Process

namespace os
{

    /**
     * @brief Get process information for a given PID.
     *
     * @param pid Process ID of the target process.
     * @return Shared pointer to a Process, or nullptr if the process does not exist.
     */
    std::shared_ptr<Process> process(pid_t pid);

    /**
     * @brief Get process information for a given PID from a pre-fetched list.
     *
     * @param pid Process ID of the target process.
     * @param processes A list of pre-fetched Process objects.
     * @return Shared pointer to a Process if found, otherwise nullptr.
     */
    std::shared_ptr<Process> process(pid_t pid, const std::list<Process> &processes);

    // Snapshot of every process visible to the caller.
    std::list<Process> processes();

    /**
     * @brief Get the direct children of a process.
     *
     * @param pid Parent process ID.
     * @param processes A pre-fetched process list.
     * @return PIDs whose parent is pid, in table order.
     */
    std::vector<pid_t> children(pid_t pid, const std::list<Process> &processes);
    std::vector<pid_t> children(pid_t pid);

    /**
     * @brief Get all transitive descendants of a process.
     *
     * The result is breadth-first: every process appears after its parent,
     * and every process of depth N appears before any process of depth N+1.
     * The root itself is not included.
     *
     * @param rootPid The root process ID.
     * @param processes A pre-fetched process list.
     */
    std::vector<pid_t> descendants(pid_t rootPid, const std::list<Process> &processes);
    std::vector<pid_t> descendants(pid_t rootPid);

    // Check if a process exists and is not a zombie.
    bool running(pid_t pid);

    /**
     * @brief Wait until a process is no longer running.
     *
     * Signal delivery is asynchronous, a process may still be listed for a
     * short time after it was killed.
     *
     * @param pid Process ID to watch.
     * @param timeout Longest time to wait.
     * @return true if the process exited (or became a zombie) in time.
     */
    bool waitExit(pid_t pid, std::chrono::milliseconds timeout);

} // namespace os
