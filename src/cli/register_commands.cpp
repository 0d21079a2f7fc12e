#include "cli/registry.hpp"

int cmd_init(int argc, char **argv);
int cmd_env(int, char **);
int cmd_clean(int, char **);
int cmd_smudge(int, char **);
int cmd_ls_files(int, char **);
int cmd_push(int, char **);
int cmd_fetch(int, char **);
int cmd_pull(int, char **);
int cmd_checkout(int, char **);
int cmd_fsck(int, char **);

namespace lfly::cli {

void register_all_commands() {
  register_command({"init", Group::Setup, ::cmd_init, "[--endpoint <url>]",
                    "Create the .lfly store in the current directory"});
  register_command({"env", Group::Setup, ::cmd_env, "", "Show paths and effective settings"});

  register_command({"push", Group::Transfer, ::cmd_push, "[--dry-run] [--object-list <file>]",
                    "Upload objects the server does not have"});
  register_command({"fetch", Group::Transfer, ::cmd_fetch, "[--dry-run] [--object-list <file>]",
                    "Download objects missing from the local store"});
  register_command({"pull", Group::Transfer, ::cmd_pull, "[--object-list <file>]",
                    "Fetch, then check out what arrived"});

  register_command({"clean", Group::Filter, ::cmd_clean, "< file",
                    "Store the content and print its pointer"});
  register_command({"smudge", Group::Filter, ::cmd_smudge, "[--skip] < pointer",
                    "Print the content for a pointer, downloading it if needed"});

  register_command({"ls-files", Group::Worktree, ::cmd_ls_files, "",
                    "List pointer files and whether their objects are present"});
  register_command({"checkout", Group::Worktree, ::cmd_checkout, "",
                    "Replace pointer files with stored content"});
  register_command({"fsck", Group::Worktree, ::cmd_fsck, "[--dry-run]",
                    "Rehash objects and quarantine corrupt ones"});
}

} // namespace lfly::cli
