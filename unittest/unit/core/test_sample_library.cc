#include <doctest/doctest.h>
#include <voxmix/sample_library.hh>
#include <voxmix/sdk/sample_store.hh>
#include <voxmix/error.hh>
#include "../../test_helpers.hh"
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace voxmix;
using namespace voxmix::test;

TEST_SUITE("SampleLibrary::Unit") {

    TEST_CASE("should_load_each_source_once") {
        memory_loader files;
        files.add("a.wav", make_wav({0.1f, 0.2f, 0.3f}, 1, 22050));
        sample_library lib(files.as_loader());

        CHECK_FALSE(lib.contains("a.wav"));
        auto first = lib.get("a.wav");
        auto second = lib.get("a.wav");
        CHECK(first == second);
        CHECK(files.load_count("a.wav") == 1);
        CHECK(lib.contains("a.wav"));
        CHECK(lib.size() == 1);
        CHECK(first->rate() == 22050);
    }

    TEST_CASE("should_preload_and_clear") {
        memory_loader files;
        files.add_store("x", make_ramp_store(10));
        sample_library lib(files.as_loader());

        lib.preload("x");
        CHECK(lib.contains("x"));

        auto held = lib.get("x");
        lib.clear();
        CHECK(lib.size() == 0);
        // stores in use survive a clear
        CHECK(held->length() == 10);

        lib.get("x");
        CHECK(files.load_count("x") == 2);
    }

    TEST_CASE("should_report_failures_as_load_error") {
        SUBCASE("loader_throws_other_exception") {
            sample_library lib([](const std::string&) -> std::shared_ptr<const sample_store> {
                throw std::runtime_error("disk on fire");
            });
            CHECK_THROWS_AS(lib.get("a"), load_error);
            CHECK_FALSE(lib.contains("a"));
        }

        SUBCASE("loader_returns_nothing") {
            sample_library lib([](const std::string&) { return std::shared_ptr<const sample_store>{}; });
            CHECK_THROWS_AS(lib.get("a"), load_error);
            CHECK(lib.size() == 0);
        }

        SUBCASE("corrupt_wav_data") {
            memory_loader files;
            files.add("bad.wav", {'n', 'o', 't', ' ', 'a', ' ', 'w', 'a', 'v'});
            sample_library lib(files.as_loader());
            CHECK_THROWS_AS(lib.get("bad.wav"), load_error);
        }

        SUBCASE("missing_file_with_default_loader") {
            sample_library lib;
            CHECK_THROWS_AS(lib.get("/nonexistent/voxmix/sound.wav"), load_error);
        }
    }

    TEST_CASE("should_read_wav_files_with_default_loader") {
        const auto path = std::filesystem::temp_directory_path() / "voxmix_test_library.wav";
        {
            const auto bytes = make_wav({0.25f, -0.25f, 0.5f, -0.5f}, 2, 44100, 32);
            std::ofstream f(path, std::ios::binary);
            f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        }

        sample_library lib;
        auto store = lib.get(path.string());
        CHECK(store->length() == 2);
        CHECK(store->rate() == 44100);
        CHECK((*store)[1].left == doctest::Approx(0.5f));
        CHECK((*store)[1].right == doctest::Approx(-0.5f));

        std::filesystem::remove(path);
    }
}
