#pragma once

#include <string>
#include <sys/types.h> // For pid_t

namespace os
{
    // One row of the process table.
    struct Process
    {
        Process(pid_t _pid,
                pid_t _parent,
                pid_t _group,
                pid_t _session,
                const std::string &_command,
                bool _zombie)
            : pid(_pid),
              parent(_parent),
              group(_group),
              session(_session),
              command(_command),
              zombie(_zombie) {}

        pid_t pid;
        pid_t parent;
        pid_t group;
        pid_t session;
        std::string command;
        bool zombie;

        bool operator<(const Process &p) const { return pid < p.pid; }
        bool operator==(const Process &p) const { return pid == p.pid; }
        bool operator!=(const Process &p) const { return pid != p.pid; }
    };
};
