#pragma once

#include "soberlauncher/internalaliases.hpp"

#include <string>
#include <vector>

using _internalaliases_dummy_anchor = soberlauncher::_internalaliases_dummy::anchor;

// Filesystem side of profile management: everything here touches disk and
// nothing here touches processes.
namespace soberlauncher {
    namespace management {
        namespace profiles {
            // Empty name, the main profile, path separators and dot names are refused.
            bool validate_name(const std::string &name, std::string &error);

            // Creates <root>/<name>/.local
            bool create_profile(const std::string &root, const std::string &name, std::string &error);

            // Recursively deletes <root>/<name>. Refuses the main profile.
            bool remove_profile(const std::string &root, const std::string &name, std::string &error);

            // ~/.var/app/<identity> for the main profile,
            // <root>/<name>/.var/app/<identity> for the rest
            std::string app_data_dir(const std::string &root,
                                     const std::string &name,
                                     const std::string &identity);

            // Deletes the .ld.so, .local and cache entries of the profile's
            // application data. Every entry is attempted; failures are
            // appended to errors.
            bool fix_profile(const std::string &root,
                             const std::string &name,
                             const std::string &identity,
                             std::vector<std::string> &errors);

            /**
             * @brief Copy the main profile's application data into a new profile.
             *
             * Copies src_app_dir (usually ~/.var/app/org.vinegarhq.Sober) into
             * <dst_profile>/.var/app/, then drops data/sober/appData from the
             * copy so the new profile logs in on its own.
             *
             * Best-effort and slow: run it off the GUI thread. A failed copy
             * is not rolled back.
             *
             * @return true on success; on failure error holds the reason
             */
            bool copy_main_profile_data(const std::string &src_app_dir,
                                        const std::string &dst_profile,
                                        std::string &error);

            // ~/Desktop when it exists, otherwise ~
            std::string desktop_entry_dir();

            // Writes <target_dir>/<profile>.desktop, mode 0755
            bool write_desktop_entry(const std::string &profile,
                                     const std::string &target_dir,
                                     const std::string &exec_line,
                                     const std::string &icon_path,
                                     std::string &written_path,
                                     std::string &error);
        }
    }
}
