#include <gtest/gtest.h>
#include <decomment/decomment.hpp>

using namespace decomment;

namespace {
const std::string C_FAMILY = "C/C++/Java/C#/JavaScript/Rust";
}

// ============================================================================
// Profiles
// ============================================================================

TEST(PatternRegistryTest, ListLanguagesInRegistrationOrder) {
    const auto& languages = PatternRegistry::list_languages();
    std::vector<std::string> expected = {"Python", C_FAMILY, "HTML/XML", "SQL", "Lua"};
    EXPECT_EQ(languages, expected);
}

TEST(PatternRegistryTest, ListLanguagesIsStable) {
    EXPECT_EQ(&PatternRegistry::list_languages(), &PatternRegistry::list_languages());
}

TEST(PatternRegistryTest, PythonProfile) {
    auto profile = PatternRegistry::language_profile("Python");
    ASSERT_TRUE(profile.ok());
    EXPECT_EQ(profile->name, "Python");
    ASSERT_TRUE(profile->line_comment.has_value());
    EXPECT_EQ(*profile->line_comment, "#");
    ASSERT_EQ(profile->block_comments.size(), 2u);
    EXPECT_EQ(profile->block_comments[0], (DelimiterPair{"\"\"\"", "\"\"\""}));
    EXPECT_EQ(profile->block_comments[1], (DelimiterPair{"'''", "'''"}));
}

TEST(PatternRegistryTest, HtmlHasNoLineComment) {
    auto profile = PatternRegistry::language_profile("HTML/XML");
    ASSERT_TRUE(profile.ok());
    EXPECT_FALSE(profile->has_line_comment());
    ASSERT_EQ(profile->block_comments.size(), 1u);
    EXPECT_EQ(profile->block_comments[0].open, "<!--");
    EXPECT_EQ(profile->block_comments[0].close, "-->");
}

TEST(PatternRegistryTest, SqlAndLuaShareLineToken) {
    auto sql = PatternRegistry::language_profile("SQL");
    auto lua = PatternRegistry::language_profile("Lua");
    ASSERT_TRUE(sql.ok());
    ASSERT_TRUE(lua.ok());

    EXPECT_EQ(*sql->line_comment, "--");
    EXPECT_EQ(*lua->line_comment, "--");
    EXPECT_EQ(sql->block_comments[0], (DelimiterPair{"/*", "*/"}));
    EXPECT_EQ(lua->block_comments[0], (DelimiterPair{"--[[", "]]"}));
}

TEST(PatternRegistryTest, EveryProfileHasSomeCommentSyntax) {
    for (const auto& name : PatternRegistry::list_languages()) {
        auto profile = PatternRegistry::language_profile(name);
        ASSERT_TRUE(profile.ok()) << name;
        EXPECT_TRUE(profile->has_line_comment() || profile->has_block_comment()) << name;
    }
}

TEST(PatternRegistryTest, UnknownLanguageFails) {
    auto profile = PatternRegistry::language_profile("Brainfuck");
    ASSERT_FALSE(profile.ok());
    EXPECT_EQ(profile.error_code(), ErrorCode::UNKNOWN_LANGUAGE);
    EXPECT_THROW(profile.value(), std::runtime_error);
    EXPECT_FALSE(PatternRegistry::has_language("Brainfuck"));
}

TEST(PatternRegistryTest, IdentifiersAreCaseSensitive) {
    EXPECT_TRUE(PatternRegistry::has_language("Python"));
    EXPECT_FALSE(PatternRegistry::has_language("python"));
}

// ============================================================================
// Extension Inference
// ============================================================================

TEST(PatternRegistryTest, ExtensionLookup) {
    EXPECT_EQ(PatternRegistry::language_for_extension("script.py"), "Python");
    EXPECT_EQ(PatternRegistry::language_for_extension("gui.pyw"), "Python");
    EXPECT_EQ(PatternRegistry::language_for_extension("main.rs"), C_FAMILY);
    EXPECT_EQ(PatternRegistry::language_for_extension("App.java"), C_FAMILY);
    EXPECT_EQ(PatternRegistry::language_for_extension("index.ts"), C_FAMILY);
    EXPECT_EQ(PatternRegistry::language_for_extension("page.htm"), "HTML/XML");
    EXPECT_EQ(PatternRegistry::language_for_extension("pom.xml"), "HTML/XML");
    EXPECT_EQ(PatternRegistry::language_for_extension("schema.sql"), "SQL");
    EXPECT_EQ(PatternRegistry::language_for_extension("init.lua"), "Lua");
}

TEST(PatternRegistryTest, ExtensionIsCaseInsensitive) {
    EXPECT_EQ(PatternRegistry::language_for_extension("foo.PY"), "Python");
    EXPECT_EQ(PatternRegistry::language_for_extension("MAIN.CPP"), C_FAMILY);
    EXPECT_EQ(PatternRegistry::language_for_extension("Query.Sql"), "SQL");
}

TEST(PatternRegistryTest, UnmappedExtensionFallsBackToDefault) {
    EXPECT_EQ(PatternRegistry::language_for_extension("foo.unknownext"), "Python");
    EXPECT_EQ(PatternRegistry::language_for_extension("noext"), "Python");
    EXPECT_EQ(PatternRegistry::language_for_extension(""), "Python");
    EXPECT_EQ(PatternRegistry::language_for_extension("trailing."), "Python");
    EXPECT_EQ(PatternRegistry::default_language(), "Python");
}

TEST(PatternRegistryTest, ExtensionUsesLastComponentOfPath) {
    EXPECT_EQ(PatternRegistry::language_for_extension("/home/user/project.sql/build"), "Python");
    EXPECT_EQ(PatternRegistry::language_for_extension("src/v1.2/main.lua"), "Lua");
    EXPECT_EQ(PatternRegistry::language_for_extension("archive.tar.sql"), "SQL");
}

TEST(PatternRegistryTest, HiddenFileHasNoExtension) {
    EXPECT_EQ(PatternRegistry::language_for_extension(".lua"), "Python");
}

TEST(PatternRegistryTest, ExtensionsForLanguage) {
    std::vector<std::string> python = {".py", ".pyw"};
    EXPECT_EQ(PatternRegistry::extensions_for("Python"), python);

    std::vector<std::string> markup = {".html", ".htm", ".xml"};
    EXPECT_EQ(PatternRegistry::extensions_for("HTML/XML"), markup);

    EXPECT_EQ(PatternRegistry::extensions_for(C_FAMILY).size(), 9u);
    EXPECT_TRUE(PatternRegistry::extensions_for("Cobol").empty());
}

TEST(PatternRegistryTest, ExtensionTableTargetsRegisteredLanguages) {
    const auto& table = PatternRegistry::extension_table();
    EXPECT_EQ(table.size(), 16u);

    for (const auto& [ext, language] : table) {
        EXPECT_TRUE(PatternRegistry::has_language(language)) << ext << " -> " << language;
        ASSERT_FALSE(ext.empty());
        EXPECT_EQ(ext.front(), '.') << ext;
        EXPECT_EQ(PatternRegistry::language_for_extension("file" + ext), language) << ext;
    }
}

TEST(PatternRegistryTest, ExtensionsForCoversWholeTable) {
    size_t total = 0;
    for (const auto& name : PatternRegistry::list_languages()) {
        total += PatternRegistry::extensions_for(name).size();
    }
    EXPECT_EQ(total, PatternRegistry::extension_table().size());
}
