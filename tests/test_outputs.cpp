#include <catch2/catch_test_macros.hpp>

#include "platform/linux/desktop_feedback.hpp"
#include "platform/linux/wayland_clipboard_output.hpp"
#include "platform/linux/wayland_paste_output.hpp"

#include <string>
#include <vector>

TEST_CASE("WaylandPasteOutput chord", "[output]") {
    using argv = std::vector<std::string>;

    SECTION("CtrlV") {
        REQUIRE(WaylandPasteOutput::chord_command("ctrl+v") ==
                argv{"wtype", "-M", "ctrl", "-k", "v"});
    }

    SECTION("TerminalPaste") {
        REQUIRE(WaylandPasteOutput::chord_command("ctrl+shift+v") ==
                argv{"wtype", "-M", "ctrl", "-M", "shift", "-k", "v"});
    }

    SECTION("SingleKey") {
        REQUIRE(WaylandPasteOutput::chord_command("Insert") == argv{"wtype", "-k", "Insert"});
    }

    SECTION("StraySeparators") {
        REQUIRE(WaylandPasteOutput::chord_command("shift++Insert") ==
                argv{"wtype", "-M", "shift", "-k", "Insert"});
    }
}

TEST_CASE("WaylandClipboardOutput saved text", "[output]") {
    const child::Result no_text{.exit_code = 1};

    SECTION("TextIsKept") {
        auto saved = WaylandClipboardOutput::text_from({.exit_code = 0, .out = "draft"}, {});
        REQUIRE(saved);
        REQUIRE(*saved == "draft");
    }

    SECTION("EmptyClipboard") {
        auto saved = WaylandClipboardOutput::text_from(no_text, {.exit_code = 1});
        REQUIRE(saved);
        REQUIRE(saved->empty());
    }

    SECTION("ImageIsNotRestorable") {
        auto saved = WaylandClipboardOutput::text_from(
            no_text, {.exit_code = 0, .out = "image/png\nimage/jpeg\n"});
        REQUIRE_FALSE(saved);
        REQUIRE(saved.error() == "clipboard holds no text (image/png)");
    }

    SECTION("NoTypesListed") {
        auto saved = WaylandClipboardOutput::text_from(no_text, {.exit_code = 0, .out = "\n"});
        REQUIRE(saved);
        REQUIRE(saved->empty());
    }
}

TEST_CASE("DesktopFeedback", "[output]") {
    SECTION("EveryCueHasASound") {
        for (auto cue : {Cue::Start, Cue::Processing, Cue::Done, Cue::Error, Cue::Reset}) {
            REQUIRE(std::string(DesktopFeedback::sound_name(cue)).size() > 0);
        }
        REQUIRE(std::string(DesktopFeedback::sound_name(Cue::Error)) == "dialog-error");
    }

    SECTION("DisabledFeedbackSpawnsNothing") {
        DesktopFeedback fb(DesktopFeedback::Options{.sounds = false, .notifications = false});
        fb.cue(Cue::Start);
        fb.notify("silent");
    }
}
