#include "test_framework.hpp"

#include "conductor/common/frontmatter.hpp"
#include "conductor/common/fs.hpp"
#include "conductor/common/hash.hpp"
#include "conductor/common/json_util.hpp"
#include "conductor/common/toml.hpp"
#include "conductor/common/worker_pool.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <atomic>
#include <set>

void register_common_tests(std::vector<conductor::tests::TestCase> &tests) {
  using conductor::tests::require;
  namespace common = conductor::common;

  tests.push_back({"result_failure_carries_kind", [] {
                     auto failed = common::Result<int>::failure("nope", common::ErrorKind::NotFound);
                     require(!failed.ok(), "failure should not be ok");
                     require(failed.kind() == common::ErrorKind::NotFound, "kind mismatch");
                     require(failed.status().kind() == common::ErrorKind::NotFound,
                             "status should keep kind");
                     bool threw = false;
                     try {
                       (void)failed.value();
                     } catch (const std::logic_error &) {
                       threw = true;
                     }
                     require(threw, "value() on failure should throw");
                   }});

  tests.push_back({"fs_is_subpath_rejects_sibling_prefix", [] {
                     require(common::is_subpath("/repo/.cursor/a.mdc", "/repo"), "child");
                     require(common::is_subpath("/repo", "/repo"), "self");
                     require(!common::is_subpath("/repository/a.mdc", "/repo"), "sibling prefix");
                     require(!common::is_subpath("/etc/passwd", "/repo"), "outside");
                   }});

  tests.push_back({"fs_read_text_file_reports_missing_as_not_found", [] {
                     conductor::testing::TempWorkspace ws;
                     auto missing = common::read_text_file(ws.path() / "nope.mdc");
                     require(!missing.ok(), "missing file should fail");
                     require(missing.kind() == common::ErrorKind::NotFound, "expected NotFound");
                     ws.create_file("a.txt", "hello");
                     auto present = common::read_text_file(ws.path() / "a.txt");
                     require(present.ok() && present.value() == "hello", "content mismatch");
                   }});

  tests.push_back({"fs_tail_chars_keeps_suffix", [] {
                     require(common::tail_chars("abcdef", 3) == "def", "tail mismatch");
                     require(common::tail_chars("ab", 5) == "ab", "short input unchanged");
                   }});

  tests.push_back({"fs_tail_chars_counts_code_points", [] {
                     std::string cyrillic;
                     for (int i = 0; i < 150; ++i) {
                       cyrillic += "я";
                     }
                     const std::string text = std::string(50, 'a') + cyrillic;
                     require(common::utf8_length(text) == 200, "200 code points");
                     const auto tail = common::tail_chars(text, 201);
                     require(tail == text, "window wider than text keeps everything");
                     const auto window = common::tail_chars(text, 151);
                     require(window == "a" + cyrillic, "151 code points, not bytes");
                     require(common::tail_chars(text, 3) == "яяя", "multi-byte tail");
                     require(!window.empty() && (static_cast<unsigned char>(window[0]) & 0xC0U) != 0x80U,
                             "cut falls on a code-point boundary");
                     require(common::tail_chars("日本語テキスト", 4) == "テキスト", "three-byte tail");
                     require(common::tail_chars("abc", 0).empty(), "zero window");
                   }});

  tests.push_back({"hash_sha256_known_vector", [] {
                     require(common::sha256_hex("abc") ==
                                 "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                             "sha256 mismatch");
                   }});

  tests.push_back({"hash_uuid_is_v4_and_unique", [] {
                     std::set<std::string> seen;
                     for (int i = 0; i < 50; ++i) {
                       const auto id = common::generate_uuid();
                       require(id.size() == 36, "uuid length");
                       require(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-',
                               "uuid dashes");
                       require(id[14] == '4', "uuid version");
                       seen.insert(id);
                     }
                     require(seen.size() == 50, "uuids should be unique");
                   }});

  tests.push_back({"json_extract_object_tolerates_code_fences", [] {
                     const auto object = common::json_extract_object(
                         "Sure:\n```json\n{\"target_agent\": \"a\", \"nested\": {\"x\": 1}}\n```");
                     require(object.has_value(), "object expected");
                     require(common::json_get_string(*object, "target_agent") == "a",
                             "field mismatch");
                     require(!common::json_extract_object("no braces here").has_value(),
                             "no object expected");
                   }});

  tests.push_back({"json_escape_roundtrips_control_characters", [] {
                     const std::string raw = "line \"one\"\n\ttab\\";
                     require(common::json_unescape(common::json_escape(raw)) == raw,
                             "escape/unescape mismatch");
                   }});

  tests.push_back({"toml_parses_sections_and_arrays", [] {
                     auto doc = common::parse_toml("root = \"/repo\"\n[router]\n"
                                                   "similarity_threshold = 0.9\n"
                                                   "[reliability]\nfallback_providers = [\"groq\", "
                                                   "\"ollama\"]\n");
                     require(doc.ok(), doc.ok() ? "" : doc.error());
                     require(doc.value().get_string("root") == "/repo", "root mismatch");
                     require(doc.value().get_double("router.similarity_threshold", 0.0) == 0.9,
                             "threshold mismatch");
                     const auto fallbacks =
                         doc.value().get_string_array("reliability.fallback_providers");
                     require(fallbacks.size() == 2 && fallbacks[1] == "ollama", "array mismatch");
                   }});

  tests.push_back({"frontmatter_nested_keys_and_lists", [] {
                     const auto fm = common::parse_frontmatter(
                         "name: python_architect\n"
                         "description: \"Designs Python systems\"\n"
                         "preferred_skills:\n"
                         "- skill-python-refactoring\n"
                         "- skill-sql-injection-prevention\n"
                         "static_skills: [base.mdc, 'style.mdc']\n"
                         "identity:\n"
                         "  role: Architect # trailing comment\n"
                         "  tone: calm\n"
                         "routing:\n"
                         "  domain_keywords:\n"
                         "    - python\n"
                         "    - django\n");
                     require(fm.get("name") == "python_architect", "name");
                     require(fm.get("description") == "Designs Python systems", "quotes stripped");
                     require(fm.list("preferred_skills").size() == 2, "block list");
                     require(fm.list("static_skills").size() == 2 &&
                                 fm.list("static_skills")[1] == "style.mdc",
                             "inline list");
                     require(fm.get("identity.role") == "Architect", "nested key with comment");
                     require(fm.has("identity"), "parent key recorded");
                     require(fm.list("routing.domain_keywords").size() == 2, "nested list");
                   }});

  tests.push_back({"frontmatter_block_scalars", [] {
                     const auto fm = common::parse_frontmatter("description: >\n"
                                                               "  first line\n"
                                                               "  second line\n"
                                                               "notes: |\n"
                                                               "  a\n"
                                                               "  b\n"
                                                               "name: x\n");
                     require(fm.get("description") == "first line second line", "folded scalar");
                     require(fm.get("notes") == "a\nb", "literal scalar");
                     require(fm.get("name") == "x", "key after block");
                   }});

  tests.push_back({"frontmatter_split_strips_block_and_trims_body", [] {
                     const auto split =
                         common::split_frontmatter("---\ndescription: d\n---\n\nBody text\n");
                     require(split.has_frontmatter, "frontmatter expected");
                     require(split.frontmatter.get("description") == "d", "description");
                     require(split.body == "Body text", "body mismatch: " + split.body);

                     const auto plain = common::split_frontmatter("No header\n");
                     require(!plain.has_frontmatter && plain.body == "No header\n",
                             "plain content unchanged");

                     const auto unterminated = common::split_frontmatter("---\nname: x\n");
                     require(!unterminated.has_frontmatter, "unterminated block is body");
                   }});

  tests.push_back({"worker_pool_runs_jobs_and_returns_values", [] {
                     common::WorkerPool pool(3);
                     require(pool.size() == 3, "thread count");
                     std::atomic<int> sum{0};
                     std::vector<std::future<int>> futures;
                     for (int i = 1; i <= 20; ++i) {
                       futures.push_back(pool.submit([i, &sum] {
                         sum += i;
                         return i * 2;
                       }));
                     }
                     int doubled = 0;
                     for (auto &future : futures) {
                       doubled += future.get();
                     }
                     require(sum.load() == 210, "all jobs should run");
                     require(doubled == 420, "results should be returned");
                   }});
}
