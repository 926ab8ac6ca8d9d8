#pragma once

#include <list>
#include <memory>
#include <ostream>

#include "linux.h"
#include "models.h"

namespace os
{
    class ProcessTree
    {
    public:
        // Returns a process subtree rooted at the specified PID, or none if
        // the specified pid could not be found in this process tree.
        std::shared_ptr<ProcessTree> find(pid_t pid) const;

        // Pre-order listing: this process first, then each child subtree.
        std::list<os::Process> getProcesses() const;

        // Checks if the specified pid is contained in this process tree.
        bool contains(pid_t pid) const;

        operator pid_t() const;

        const Process process;
        const std::list<ProcessTree> children;

    private:
        friend std::shared_ptr<ProcessTree> pstree(pid_t, const std::list<Process> &);

        ProcessTree(const Process &_process, const std::list<ProcessTree> &_children);
    };

    std::ostream &operator<<(std::ostream &stream, const ProcessTree &tree);

    // Returns a process tree rooted at the specified pid using the
    // specified list of processes, or nullptr if pid is not in the list.
    std::shared_ptr<ProcessTree> pstree(pid_t pid, const std::list<Process> &processes);

    // Returns a process tree for the specified pid (the current process if pid is 0).
    std::shared_ptr<ProcessTree> pstree(pid_t pid = 0);

} // namespace os
