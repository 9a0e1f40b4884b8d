#pragma once

#include <string>
#include <vector>

namespace stagefmt
{
    struct stagefmt_vcs
    {
        virtual ~stagefmt_vcs() = default;

        /**
         * Resolves the top-level directory of the working tree containing the current directory. Staged
         * paths are relative to it.
         */
        [[nodiscard]] virtual bool root_directory(std::string& directory) = 0;

        /**
         * Lists the paths staged for the next commit, in index order, excluding staged deletions.
         */
        [[nodiscard]] virtual bool list_staged_files(std::vector<std::string>& files) = 0;
    };
}
