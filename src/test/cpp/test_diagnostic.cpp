#include <memory_resource>
#include <optional>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "slopcc/util/severity.hpp"

#include "slopcc/diagnostic.hpp"
#include "slopcc/fwd.hpp"
#include "slopcc/span.hpp"

namespace slopcc {
namespace {

constexpr auto main_file = File_Id(0);

TEST(Severity, ordering)
{
    EXPECT_LT(Severity::note, Severity::warning);
    EXPECT_LT(Severity::warning, Severity::error);
    EXPECT_LT(Severity::error, Severity::none);
    EXPECT_TRUE(severity_is_emittable(Severity::warning));
    EXPECT_FALSE(severity_is_emittable(Severity::none));
    EXPECT_EQ(severity_tag(Severity::error), u8"ERROR");
}

TEST(Diagnostics, preserves_insertion_order)
{
    Diagnostics diagnostics;
    diagnostics.log(Severity::warning, diagnostic::comment_unterminated, Span::at(main_file, 3), u8"b");
    diagnostics.log(Severity::error, diagnostic::stray_character, Span { main_file, 0, 1 }, u8"a");
    diagnostics.log(Severity::note, diagnostic::not_implemented, std::nullopt, u8"c");

    ASSERT_EQ(diagnostics.size(), 3);
    EXPECT_EQ(diagnostics[0].message, u8"b");
    EXPECT_EQ(diagnostics[1].message, u8"a");
    EXPECT_EQ(diagnostics[2].message, u8"c");
    EXPECT_EQ(diagnostics[1].location, (Span { main_file, 0, 1 }));
    EXPECT_EQ(diagnostics[2].location, std::nullopt);

    std::vector<std::u8string_view> ids;
    for (const Diagnostic& d : diagnostics) {
        ids.push_back(d.id);
    }
    const std::vector<std::u8string_view> expected {
        diagnostic::comment_unterminated,
        diagnostic::stray_character,
        diagnostic::not_implemented,
    };
    EXPECT_EQ(ids, expected);
    EXPECT_EQ(diagnostics.all().size(), 3);
}

TEST(Diagnostics, counts_errors)
{
    Diagnostics diagnostics;
    EXPECT_TRUE(diagnostics.empty());
    EXPECT_FALSE(diagnostics.has_errors());

    diagnostics.log(Severity::warning, diagnostic::comment_unterminated, std::nullopt, u8"w");
    EXPECT_FALSE(diagnostics.has_errors());
    EXPECT_EQ(diagnostics.error_count(), 0);

    diagnostics.log(Severity::error, diagnostic::string_unterminated, std::nullopt, u8"e");
    diagnostics.log(Severity::error, diagnostic::char_unterminated, std::nullopt, u8"e");
    EXPECT_TRUE(diagnostics.has_errors());
    EXPECT_EQ(diagnostics.error_count(), 2);
    EXPECT_EQ(diagnostics.size(), 3);
}

TEST(Diagnostics, was_logged)
{
    Diagnostics diagnostics;
    diagnostics.push({ .severity = Severity::error,
                       .id = diagnostic::file_io,
                       .location = std::nullopt,
                       .message = u8"cannot open" });
    EXPECT_TRUE(diagnostics.was_logged(diagnostic::file_io));
    EXPECT_FALSE(diagnostics.was_logged(diagnostic::stray_character));
}

TEST(Diagnostics, min_severity_filters)
{
    Diagnostics diagnostics { std::pmr::get_default_resource(), Severity::warning };
    EXPECT_FALSE(diagnostics.can_log(Severity::note));
    EXPECT_TRUE(diagnostics.can_log(Severity::warning));

    diagnostics.log(Severity::note, diagnostic::not_implemented, std::nullopt, u8"dropped");
    diagnostics.log(Severity::warning, diagnostic::comment_unterminated, std::nullopt, u8"kept");
    ASSERT_EQ(diagnostics.size(), 1);
    EXPECT_EQ(diagnostics[0].message, u8"kept");

    diagnostics.set_min_severity(Severity::none);
    diagnostics.log(Severity::error, diagnostic::stray_character, std::nullopt, u8"dropped");
    EXPECT_EQ(diagnostics.size(), 1);
    EXPECT_FALSE(diagnostics.has_errors());
}

TEST(Logger, ignorant_logger_accepts_everything)
{
    Ignorant_Logger logger { Severity::min };
    EXPECT_TRUE(logger.can_log(Severity::note));
    logger.log(Severity::error, diagnostic::stray_character, std::nullopt, u8"ignored");
    EXPECT_EQ(logger.get_min_severity(), Severity::min);
}

} // namespace
} // namespace slopcc
