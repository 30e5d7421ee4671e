#include "test_framework.hpp"

#include "shellwarden/security/command_safety.hpp"

#include <string>
#include <vector>

namespace {

using shellwarden::security::is_chmod_mode;
using shellwarden::security::is_known_safe_command;
using shellwarden::security::is_safe_read_command;
using shellwarden::security::kSafeReadCommands;
using shellwarden::tests::require;
using shellwarden::tests::TestCase;

using Tokens = std::vector<std::string>;

void expect_safe(const Tokens &tokens, const bool expected) {
  std::string rendered;
  for (const auto &token : tokens) {
    rendered += (rendered.empty() ? "" : " ") + token;
  }
  require(is_known_safe_command(tokens) == expected,
          rendered + " should be " + (expected ? "known-safe" : "not known-safe"));
}

} // namespace

void register_command_safety_tests(std::vector<TestCase> &tests) {
  tests.push_back({"command_safety_every_read_verb_is_safe", [] {
                     for (const auto verb : kSafeReadCommands) {
                       const std::string command(verb);
                       require(is_safe_read_command(command), command + " should be read-only");
                       require(is_known_safe_command({command, "/etc/passwd"}),
                               command + " with arguments should be safe");
                     }
                   }});

  tests.push_back({"command_safety_read_verbs_ignore_arguments", [] {
                     expect_safe({"cat", "/etc/passwd"}, true);
                     expect_safe({"grep", "-r", "TODO", "."}, true);
                     expect_safe({"find", ".", "-name", "*.ts"}, true);
                     expect_safe({"LS", "-la"}, true);
                   }});

  tests.push_back({"command_safety_prefix_match_overreaches", [] {
                     // "w" is on the list, so anything starting with w matches.
                     require(is_safe_read_command("wget http://example.com"), "wget matches w");
                     require(is_safe_read_command("echo-server"), "echo-server matches echo");
                     require(!is_safe_read_command("rm -rf /"), "rm is not read-only");
                     require(!is_safe_read_command(""), "empty command is not read-only");
                   }});

  tests.push_back({"command_safety_sudo_prefix_is_stripped", [] {
                     expect_safe({"sudo", "cat", "/etc/shadow"}, true);
                     expect_safe({"sudo", "git", "status"}, true);
                     expect_safe({"sudo", "rm", "-rf", "/"}, false);
                     expect_safe({"sudo"}, false);
                   }});

  tests.push_back({"command_safety_git_status_only", [] {
                     expect_safe({"git", "status"}, true);
                     expect_safe({"git", "-C", "repo", "status", "--short"}, true);
                     expect_safe({"git", "push", "--force"}, false);
                     expect_safe({"git", "reset", "--hard"}, false);
                   }});

  tests.push_back({"command_safety_local_python_scripts", [] {
                     expect_safe({"./run_tests.py"}, true);
                     expect_safe({"./Tools/Build.PY", "--fast"}, true);
                     expect_safe({"python", "script.py"}, false);
                     expect_safe({"../escape.py"}, false);
                     expect_safe({"./script.sh"}, false);
                   }});

  tests.push_back({"command_safety_sed_in_place_is_unsafe", [] {
                     expect_safe({"sed", "-n", "1,20p", "file.txt"}, true);
                     expect_safe({"sed", "-i", "s/a/b/", "file.txt"}, false);
                     expect_safe({"sed", "-i.bak", "s/a/b/", "file.txt"}, false);
                     expect_safe({"sed", "--in-place=.orig", "s/a/b/", "file.txt"}, false);
                     expect_safe({"sed", "--in-place", "s/a/b/", "file.txt"}, false);
                   }});

  tests.push_back({"command_safety_chmod_requires_mode_and_path", [] {
                     expect_safe({"chmod", "+x", "a.py"}, true);
                     expect_safe({"sudo", "chmod", "755", "run.sh"}, true);
                     expect_safe({"chmod", "-R", "u+rw", "dir"}, true);
                     expect_safe({"chmod", "0644", "a", "b"}, true);
                     expect_safe({"chmod", "+"}, false);
                     expect_safe({"chmod", "+", "a.py"}, false);
                     expect_safe({"chmod", "+x"}, false);
                     expect_safe({"chmod", "999", "a.py"}, false);
                     expect_safe({"chmod"}, false);
                   }});

  tests.push_back({"command_safety_chmod_mode_patterns", [] {
                     require(is_chmod_mode("u+x"), "u+x");
                     require(is_chmod_mode("go-w"), "go-w");
                     require(is_chmod_mode("a=rx"), "a=rx");
                     require(is_chmod_mode("+t"), "+t");
                     require(is_chmod_mode("755"), "755");
                     require(is_chmod_mode("4755"), "4755");
                     require(!is_chmod_mode("75"), "two digits");
                     require(!is_chmod_mode("u,x"), "comma is not an operator");
                     require(!is_chmod_mode("ux"), "operator required");
                     require(!is_chmod_mode("5x"), "digit is not an operator");
                     require(!is_chmod_mode("u/x"), "slash is not an operator");
                     expect_safe({"chmod", "5x", "f"}, false);
                   }});

  tests.push_back({"command_safety_everything_else_needs_assessment", [] {
                     expect_safe({}, false);
                     expect_safe({"rm", "-rf", "node_modules"}, false);
                     expect_safe({"npm", "install"}, false);
                     expect_safe({"curl", "https://example.com"}, false);
                     expect_safe({"bash", "-c", "ls"}, false);
                   }});

  tests.push_back({"command_safety_workdir_does_not_change_verdict", [] {
                     require(is_known_safe_command({"ls"}, std::string("/workspace/src")),
                             "ls with workdir");
                     require(!is_known_safe_command({"rm", "x"}, std::string("/tmp")),
                             "rm with workdir");
                   }});
}
