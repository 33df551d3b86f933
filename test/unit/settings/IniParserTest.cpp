// IniParser unit tests

#include "test_utils.h"

#include <IniParser.h>

#include <string>
#include <vector>

#include "../EpubFixture.h"

namespace {
struct Entry {
  std::string section;
  std::string key;
  std::string value;
};

std::vector<Entry> collect(const char* content) {
  std::vector<Entry> entries;
  IniParser::parseString(content, [&entries](const char* section, const char* key, const char* value) {
    entries.push_back({section, key, value});
    return true;
  });
  return entries;
}
}  // namespace

int main() {
  TestUtils::TestRunner runner("IniParser");

  // Test 1: Sections, keys, whitespace and comments
  {
    const auto entries = collect(
        "# leading comment\n"
        "top = level\n"
        "[formatting]\n"
        "  paragraph_spacing   =   2  \n"
        "; another comment\n"
        "\n"
        "[ display ]\r\n"
        "fill_to_next_chapter = yes # trailing comment\r\n"
        "color = #fff\n"
        "no equals sign here\n"
        " = orphan value\n");
    runner.expectEq(size_t(4), entries.size(), "basic: four pairs");
    if (entries.size() == 4) {
      runner.expectEqual("", entries[0].section, "basic: no section before the first header");
      runner.expectEqual("level", entries[0].value, "basic: top-level value");
      runner.expectEqual("formatting", entries[1].section, "basic: section name");
      runner.expectEqual("paragraph_spacing", entries[1].key, "basic: key trimmed");
      runner.expectEqual("2", entries[1].value, "basic: value trimmed");
      runner.expectEqual("display", entries[2].section, "basic: section trimmed");
      runner.expectEqual("yes", entries[2].value, "basic: inline comment and CR stripped");
      runner.expectEqual("#fff", entries[3].value, "basic: marker without whitespace kept");
    }
  }

  // Test 2: Callback can stop parsing
  {
    int calls = 0;
    IniParser::parseString("a=1\nb=2\nc=3\n", [&calls](const char*, const char*, const char*) {
      calls++;
      return calls < 2;
    });
    runner.expectEq(2, calls, "stop: parsing ends when the callback returns false");
  }

  // Test 3: Files, including a missing one and an overlong line
  {
    const std::string dir = EpubFixture::makeTempDir("folio-ini");
    const std::string path = dir + "/config.ini";
    const std::string content = "[reading]\nlong = " + std::string(1000, 'x') + "\nafter = ok\n";
    EpubFixture::ZipBuilder::writeBytes(path, content);

    std::vector<Entry> entries;
    const bool parsed = IniParser::parseFile(path.c_str(), [&entries](const char* s, const char* k, const char* v) {
      entries.push_back({s, k, v});
      return true;
    });
    runner.expectTrue(parsed, "file: parsed");
    runner.expectEq(size_t(2), entries.size(), "file: overlong line truncated, next line intact");
    if (entries.size() == 2) {
      runner.expectTrue(entries[0].value.size() < 512, "file: long value cut at the line limit");
      runner.expectEqual("ok", entries[1].value, "file: following line read");
      runner.expectEqual("reading", entries[1].section, "file: section kept");
    }

    runner.expectFalse(IniParser::parseFile((dir + "/missing.ini").c_str(),
                                            [](const char*, const char*, const char*) { return true; }),
                       "file: missing file fails");
    EpubFixture::removeTree(dir);
  }

  // Test 4: Value helpers
  {
    runner.expectTrue(IniParser::parseBool("TRUE"), "bool: TRUE");
    runner.expectTrue(IniParser::parseBool("on"), "bool: on");
    runner.expectTrue(IniParser::parseBool("1"), "bool: 1");
    runner.expectFalse(IniParser::parseBool("No", true), "bool: No");
    runner.expectFalse(IniParser::parseBool("off", true), "bool: off");
    runner.expectTrue(IniParser::parseBool("maybe", true), "bool: unknown keeps default true");
    runner.expectFalse(IniParser::parseBool("", false), "bool: empty keeps default false");

    runner.expectEq(42, IniParser::parseInt("42"), "int: plain");
    runner.expectEq(-7, IniParser::parseInt("-7"), "int: negative");
    runner.expectEq(5, IniParser::parseInt("12abc", 5), "int: trailing garbage rejected");
    runner.expectEq(5, IniParser::parseInt("", 5), "int: empty rejected");
    runner.expectEq(5, IniParser::parseInt("99999999999999999999", 5), "int: overflow rejected");
  }

  return runner.allPassed() ? 0 : 1;
}
