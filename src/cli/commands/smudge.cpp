#include "cli/command.hpp"
#include "cli/context.hpp"
#include "lfly/filters.hpp"
#include "lfly/pointer.hpp"

#include <cstring>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

// stdin: pointer, stdout: file content
int cmd_smudge(int argc, char **argv) {
  bool skip = false;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--skip") == 0) {
      skip = true;
    } else {
      throw lfly::cli::UsageError(std::string("unexpected argument '") + argv[i] + "'");
    }
  }
  lfly::cli::Context ctx{lfly::cli::find_root(std::filesystem::current_path())};
  const std::string input{std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
  const auto ptr = lfly::parse_pointer(input);
  if (!ptr) {
    // not a pointer: pass through untouched
    std::cout << input;
    return std::cout.flush() ? 0 : 1;
  }

  lfly::Fetcher fetch;
  if (!skip) {
    fetch = [&ctx](const lfly::Pointer &p) {
      const std::vector<lfly::ObjectRef> refs{{p.oid, p.size, p.oid}};
      if (lfly::cli::download_refs(ctx, refs, false, "smudge") != 0) {
        throw std::runtime_error("cannot download " + p.oid);
      }
    };
  }
  lfly::smudge(*ptr, ctx.store, std::cout, fetch);
  return std::cout.flush() ? 0 : 1;
}
