#include "test_framework.hpp"

#include "chunkguard/common/base64.hpp"
#include "chunkguard/common/error.hpp"
#include "chunkguard/common/result.hpp"
#include "chunkguard/common/toml.hpp"
#include "chunkguard/common/utf8.hpp"

#include <stdexcept>

void register_common_tests(chunkguard::tests::TestList &tests) {
  using chunkguard::tests::require;
  namespace cm = chunkguard::common;

  tests.push_back({"result_value_on_failure_throws", [] {
                     const auto failed = cm::Result<int>::failure("boom");
                     require(!failed.ok(), "failure should not be ok");
                     bool threw = false;
                     try {
                       (void)failed.value();
                     } catch (const std::logic_error &ex) {
                       threw = std::string(ex.what()).find("boom") != std::string::npos;
                     }
                     require(threw, "value() on failure should throw with the error text");
                   }});

  tests.push_back({"result_structured_error_describes_itself", [] {
                     const auto failed = cm::Result<int, cm::ChunkError>::failure(
                         cm::ChunkError::capacity_exceeded(cm::LimitDimension::Bytes, 12, 10));
                     require(failed.error().code == cm::ErrorCode::CapacityExceeded,
                             "code should survive");
                     const std::string text = failed.error().to_string();
                     require(text.find("maxBytes") != std::string::npos, "dimension missing");
                     require(text.find("actual=12") != std::string::npos, "actual missing");
                     require(text.find("allowed=10") != std::string::npos, "allowed missing");
                   }});

  tests.push_back({"utf8_validation_rejects_malformed_sequences", [] {
                     require(cm::is_valid_utf8("plain ascii"), "ascii should be valid");
                     require(cm::is_valid_utf8("h\xC3\xA9llo \xF0\x9F\x98\x80"),
                             "mixed widths should be valid");
                     require(!cm::is_valid_utf8("\xFF"), "0xFF is never valid");
                     require(!cm::is_valid_utf8("\xC0\xAF"), "overlong form should be rejected");
                     require(!cm::is_valid_utf8("\xED\xA0\x80"), "surrogate should be rejected");
                     require(!cm::is_valid_utf8("\xE2\x82"), "truncated tail should be rejected");
                     require(!cm::is_valid_utf8("\xF4\x90\x80\x80"),
                             "code points above U+10FFFF should be rejected");
                   }});

  tests.push_back({"utf8_offsets_and_widths", [] {
                     const std::string text = "a\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80";
                     const auto offsets = cm::utf8_offsets(text);
                     require(offsets.size() == 5, "four characters plus the end offset");
                     require(offsets[1] == 1 && offsets[2] == 3 && offsets[3] == 6,
                             "offsets should follow sequence widths");
                     require(offsets[4] == text.size(), "last offset is the byte length");
                     require(cm::utf8_length(text) == 4, "four code points");
                     require(cm::utf8_max_width(text) == 4, "emoji is the widest");
                     require(cm::utf8_max_width("") == 0, "empty text has no width");
                   }});

  tests.push_back({"utf8_offsets_for_a_window", [] {
                     const std::string text = "a\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80";
                     const auto middle = cm::utf8_offsets(text, 1, 2);
                     require(middle.size() == 3, "two characters plus the end offset");
                     require(middle[0] == 1 && middle[1] == 3 && middle[2] == 6,
                             "window offsets stay absolute");

                     const auto tail = cm::utf8_offsets(text, 6, 10);
                     require(tail.size() == 2 && tail[1] == text.size(),
                             "window stops at the end of the text");

                     const auto past_end = cm::utf8_offsets(text, text.size(), 4);
                     require(past_end.size() == 1 && past_end[0] == text.size(),
                             "window at the end is empty");
                   }});

  tests.push_back({"base64_decode_variants", [] {
                     const auto padded = cm::base64_decode("aGVsbG8=");
                     require(padded.ok(), padded.ok() ? "" : padded.error());
                     require(std::string(padded.value().begin(), padded.value().end()) == "hello",
                             "padded decode mismatch");

                     const auto unpadded = cm::base64_decode("aGVsbG8");
                     require(unpadded.ok() && unpadded.value().size() == 5,
                             "missing padding should be restored");

                     const auto wrapped = cm::base64_decode("aGVs\nbG8=\n");
                     require(wrapped.ok() && wrapped.value().size() == 5,
                             "line breaks should be ignored");

                     const auto url_safe = cm::base64_decode("-_8");
                     require(url_safe.ok() && url_safe.value().size() == 2 &&
                                 url_safe.value()[0] == 0xFB && url_safe.value()[1] == 0xFF,
                             "url-safe alphabet should decode");

                     require(!cm::base64_decode("@@@@").ok(), "invalid alphabet should fail");
                     require(!cm::base64_decode("abcde").ok(), "impossible length should fail");
                   }});

  tests.push_back({"base64_encode_matches_decoder", [] {
                     const std::vector<std::uint8_t> bytes = {0x00, 0x10, 0xFF, 0x7F};
                     const std::string encoded = cm::base64_encode(bytes);
                     require(encoded == "ABD/fw==", "unexpected encoding: " + encoded);
                     const auto decoded = cm::base64_decode(encoded);
                     require(decoded.ok() && decoded.value() == bytes, "decode should invert encode");
                   }});

  tests.push_back({"toml_parses_sections_and_quoted_segments", [] {
                     const auto parsed = cm::parse_toml(
                         "# comment\n"
                         "[defaults]\n"
                         "chunk_overlap = 12 # trailing\n"
                         "[limits.bedrock.\"anthropic.claude-v2:1\"]\n"
                         "max_bytes = 1_000\n");
                     require(parsed.ok(), parsed.ok() ? "" : parsed.error());
                     const auto &doc = parsed.value();
                     require(doc.get_u64("defaults.chunk_overlap", 0) == 12, "overlap mismatch");
                     const auto tables = doc.tables_under("limits");
                     require(tables.size() == 1, "expected one limits table");
                     require(tables[0]->path.size() == 3, "quoted segment should stay whole");
                     require(tables[0]->path[2] == "anthropic.claude-v2:1", "model name mismatch");
                     require(tables[0]->values.at("max_bytes") == "1_000", "raw value mismatch");
                     require(cm::parse_toml_u64("1_000").value() == 1000,
                             "underscores should be accepted");
                   }});

  tests.push_back({"toml_reports_line_of_error", [] {
                     const auto parsed = cm::parse_toml("[ok]\nkey = 1\nnot a pair\n");
                     require(!parsed.ok(), "missing '=' should fail");
                     require(parsed.error().find("line 3") != std::string::npos,
                             "error should name the line: " + parsed.error());

                     const auto bad_header = cm::parse_toml("[limits.\"open]\n");
                     require(!bad_header.ok(), "unterminated quote should fail");
                     require(!cm::parse_toml_u64("-5").ok(), "negative values are not u64");
                   }});
}
