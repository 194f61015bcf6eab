#include "test_framework.hpp"

#include "conductor/common/fs.hpp"
#include "conductor/prompt/agent_profile.hpp"
#include "conductor/prompt/resolver.hpp"
#include "tests/helpers/test_helpers.hpp"

namespace {

namespace pr = conductor::prompt;

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

std::size_t occurrences(const std::string &haystack, const std::string &needle) {
  std::size_t total = 0;
  for (auto pos = haystack.find(needle); pos != std::string::npos;
       pos = haystack.find(needle, pos + 1)) {
    ++total;
  }
  return total;
}

} // namespace

void register_prompt_tests(std::vector<conductor::tests::TestCase> &tests) {
  using conductor::tests::require;
  using conductor::testing::agent_document;
  using conductor::testing::TempWorkspace;

  tests.push_back({"parse_prompt_splits_references", [] {
                     const auto nodes =
                         pr::parse_prompt("Intro @agents/common/base.mdc and @skills/x-y.mdc.");
                     require(nodes.size() == 5, "expected 5 nodes, got " +
                                                    std::to_string(nodes.size()));
                     require(nodes[0].kind == pr::PromptNode::Kind::Literal &&
                                 nodes[0].text == "Intro ",
                             "leading literal");
                     require(nodes[1].kind == pr::PromptNode::Kind::Reference &&
                                 nodes[1].text == "@agents/common/base.mdc",
                             "first reference");
                     require(nodes[3].text == "@skills/x-y.mdc", "second reference");
                     require(nodes[4].text == ".", "trailing literal");
                     require(pr::parse_prompt("email me@example.com").size() == 1,
                             "non-mdc mention stays literal");
                   }});

  tests.push_back({"resolver_maps_reference_forms", [] {
                     TempWorkspace ws;
                     ws.create_file(".cursor/skills/present.mdc", "x");
                     const pr::PromptResolver resolver(ws.path());
                     const auto root = resolver.root();

                     auto cursor = resolver.resolve_path("@.cursor/skills/a.mdc");
                     require(cursor.ok() && cursor.value() == root / ".cursor/skills/a.mdc",
                             "explicit .cursor path");
                     auto agents = resolver.resolve_path("@agents/common/base.mdc");
                     require(agents.ok() &&
                                 agents.value() == root / ".cursor/agents/common/base.mdc",
                             "agents shorthand");
                     auto present = resolver.resolve_path("@skills/present.mdc");
                     require(present.ok() && present.value() == root / ".cursor/skills/present.mdc",
                             "existing file under .cursor preferred");
                     auto absent = resolver.resolve_path("@docs/absent.mdc");
                     require(absent.ok() && absent.value() == root / "docs/absent.mdc",
                             "otherwise relative to root");
                     auto plain = resolver.resolve_path("docs/readme.mdc");
                     require(plain.ok() && plain.value() == root / "docs/readme.mdc",
                             "no sigil is root-relative");
                   }});

  tests.push_back({"resolver_blocks_traversal", [] {
                     TempWorkspace ws;
                     const pr::PromptResolver resolver(ws.path() / "repo");
                     auto escaped = resolver.resolve_path("@../../etc/passwd.mdc");
                     require(!escaped.ok(), "traversal must fail");
                     require(escaped.kind() == conductor::common::ErrorKind::SecurityViolation,
                             "security kind expected");
                     require(escaped.error() == "Security Error: Access denied for path "
                                                "'@../../etc/passwd.mdc'. Cannot access outside "
                                                "repository.",
                             "message mismatch: " + escaped.error());

                     const auto expanded = resolver.expand("Before @../../etc/passwd.mdc After");
                     require(contains(expanded, "[SECURITY BLOCK: Security Error: Access denied"),
                             "inline security marker expected: " + expanded);
                     require(contains(expanded, "Before ") && contains(expanded, " After"),
                             "surrounding text kept");
                     require(!contains(expanded, "root:"), "no file content may leak");
                   }});

  tests.push_back({"resolver_expands_nested_and_strips_frontmatter", [] {
                     TempWorkspace ws;
                     ws.create_file(".cursor/agents/common/base.mdc",
                                    "---\ndescription: shared\n---\nBase rules. @skills/tone.mdc");
                     ws.create_file(".cursor/skills/tone.mdc", "Be concise.");
                     ws.create_agent("writer", agent_document("writer",
                                                              "You write.\n@agents/common/base.mdc"));
                     const pr::PromptResolver resolver(ws.path());
                     const auto prompt = resolver.load_agent_prompt("writer");
                     require(prompt == "You write.\nBase rules. Be concise.",
                             "expanded prompt mismatch: " + prompt);
                     require(!contains(prompt, "description:"), "frontmatter must be stripped");
                   }});

  tests.push_back({"resolver_marks_self_reference", [] {
                     TempWorkspace ws;
                     ws.create_agent("loop", agent_document("loop",
                                                            "Start @agents/loop/system_prompt.mdc End"));
                     const pr::PromptResolver resolver(ws.path());
                     const auto prompt = resolver.load_agent_prompt("loop");
                     require(prompt == "Start Start [CIRCULAR REFERENCE: "
                                       "@agents/loop/system_prompt.mdc] End End",
                             "self reference expands once, then marks: " + prompt);
                   }});

  tests.push_back({"resolver_marks_mutual_cycle_once", [] {
                     TempWorkspace ws;
                     ws.create_file(".cursor/a.mdc", "A(@.cursor/b.mdc)");
                     ws.create_file(".cursor/b.mdc", "B(@.cursor/a.mdc)");
                     const pr::PromptResolver resolver(ws.path());
                     const auto expanded = resolver.resolve(".cursor/a.mdc");
                     require(expanded == "A(B(A([CIRCULAR REFERENCE: @.cursor/b.mdc])))",
                             "cycle should stop at the repeat: " + expanded);
                   }});

  tests.push_back({"resolver_expands_repeated_sibling_once", [] {
                     TempWorkspace ws;
                     ws.create_file(".cursor/skills/rule.mdc", "R");
                     const pr::PromptResolver resolver(ws.path());
                     const auto expanded = resolver.expand("@skills/rule.mdc + @skills/rule.mdc");
                     require(expanded == "R + [CIRCULAR REFERENCE: @skills/rule.mdc]",
                             "second import is marked: " + expanded);
                   }});

  tests.push_back({"resolver_marks_document_reached_through_two_parents", [] {
                     TempWorkspace ws;
                     ws.create_file(".cursor/agents/common/x.mdc", "X-BODY");
                     ws.create_file(".cursor/agents/common/y.mdc", "Y: @agents/common/x.mdc");
                     ws.create_file(".cursor/top.mdc", "@agents/common/x.mdc / @agents/common/x.mdc"
                                                       " / @agents/common/y.mdc");
                     const pr::PromptResolver resolver(ws.path());
                     const auto expanded = resolver.resolve(".cursor/top.mdc");
                     require(expanded == "X-BODY / [CIRCULAR REFERENCE: @agents/common/x.mdc] / "
                                         "Y: [CIRCULAR REFERENCE: @agents/common/x.mdc]",
                             "earlier imports are seen by later siblings and their children: " +
                                 expanded);
                   }});

  tests.push_back({"resolver_keeps_nested_imports_out_of_parent_scope", [] {
                     TempWorkspace ws;
                     ws.create_file(".cursor/skills/leaf.mdc", "L");
                     ws.create_file(".cursor/skills/mid.mdc", "M(@skills/leaf.mdc)");
                     const pr::PromptResolver resolver(ws.path());
                     const auto expanded = resolver.expand("@skills/mid.mdc @skills/leaf.mdc");
                     require(expanded == "M(L) L", "imports inside a child do not mark parent "
                                                   "siblings: " + expanded);
                   }});

  tests.push_back({"resolver_marks_missing_fragment", [] {
                     TempWorkspace ws;
                     const pr::PromptResolver resolver(ws.path());
                     const auto expanded = resolver.expand("x @skills/ghost.mdc y");
                     const auto expected_path = (resolver.root() / "skills/ghost.mdc").string();
                     require(expanded == "x [MISSING FILE: " + expected_path + "] y",
                             "missing marker mismatch: " + expanded);
                     require(pr::count_markers(expanded) == 1, "one marker");
                   }});

  tests.push_back({"resolver_top_level_errors_throw", [] {
                     TempWorkspace ws;
                     const pr::PromptResolver resolver(ws.path());
                     bool not_found = false;
                     try {
                       (void)resolver.load_agent_prompt("nobody");
                     } catch (const pr::NotFoundError &e) {
                       not_found = contains(e.what(), "Agent prompt not found for 'nobody'");
                     }
                     require(not_found, "missing agent should throw NotFoundError");

                     bool security = false;
                     try {
                       (void)resolver.load_agent_prompt("../../../../etc");
                     } catch (const pr::SecurityError &e) {
                       security = contains(e.what(), "Invalid agent name");
                     }
                     require(security, "escaping agent name should throw SecurityError");
                   }});

  tests.push_back({"resolver_never_reads_outside_root", [] {
                     TempWorkspace ws;
                     ws.create_file("outside/secret.mdc", "TOP SECRET");
                     ws.create_file("repo/.cursor/agents/spy/system_prompt.mdc",
                                    "Leak: @../../outside/secret.mdc @.cursor/../../outside/"
                                    "secret.mdc");
                     const pr::PromptResolver resolver(ws.path() / "repo");
                     const auto prompt = resolver.load_agent_prompt("spy");
                     require(!contains(prompt, "TOP SECRET"), "outside content leaked");
                     require(occurrences(prompt, "[SECURITY BLOCK: ") == 2,
                             "both escapes blocked: " + prompt);
                   }});

  tests.push_back({"agent_profile_reads_frontmatter", [] {
                     TempWorkspace ws;
                     ws.create_agent("python_architect",
                                     "---\nname: python_architect\ndescription: Python\n"
                                     "preferred_skills:\n  - skill-python-refactoring\n"
                                     "identity:\n  role: Architect\n"
                                     "routing:\n  domain_keywords: [python, django]\n"
                                     "  trigger_command: /py\n"
                                     "---\nBody");
                     const pr::PromptResolver resolver(ws.path());
                     auto profile = pr::load_agent_profile(resolver, "python_architect");
                     require(profile.ok(), profile.ok() ? "" : profile.error());
                     require(profile.value().preferred_skills.size() == 1 &&
                                 profile.value().preferred_skills[0] == "skill-python-refactoring",
                             "preferred skills");
                     require(profile.value().identity.role == "Architect", "identity role");
                     require(profile.value().routing.domain_keywords.size() == 2, "keywords");
                     require(profile.value().routing.trigger_command == "/py", "trigger");

                     auto missing = pr::load_agent_profile(resolver, "ghost");
                     require(!missing.ok() &&
                                 missing.kind() == conductor::common::ErrorKind::NotFound,
                             "missing agent is NotFound");
                   }});

  tests.push_back({"agent_validation_reports_errors_and_warnings", [] {
                     const auto good = conductor::common::parse_frontmatter(
                         "name: a\ndescription: b\nstatic_skills: [base.mdc]\n"
                         "preferred_skills:\n  - skill-x\n");
                     require(pr::validate_agent_profile(good).valid(), "good profile");
                     require(pr::validate_agent_profile(good).warnings.empty(), "no warnings");

                     const auto bad = conductor::common::parse_frontmatter(
                         "description: b\nskills: [x]\nidentity:\n  role: r\n"
                         "static_skills: [base]\npreferred_skills: [skill-y.mdc]\n");
                     const auto report = pr::validate_agent_profile(bad);
                     require(!report.valid(), "missing name should fail");
                     require(report.errors.size() == 4,
                             "name plus three identity fields: " +
                                 std::to_string(report.errors.size()));
                     require(report.warnings.size() == 3,
                             "deprecated skills plus two extension warnings: " +
                                 std::to_string(report.warnings.size()));
                   }});

  tests.push_back({"scan_agents_skips_common_and_hidden", [] {
                     TempWorkspace ws;
                     ws.create_agent("zeta", "z");
                     ws.create_agent("alpha", "a");
                     ws.create_agent("common", "c");
                     ws.create_agent(".hidden", "h");
                     ws.create_file(".cursor/agents/empty/notes.md", "no prompt");
                     const auto agents = pr::scan_agents(ws.path() / ".cursor/agents");
                     require(agents == std::vector<std::string>({"alpha", "zeta"}),
                             "sorted agents without common/hidden/empty");
                     require(pr::scan_agents(ws.path() / "missing").empty(), "missing dir");
                   }});
}
