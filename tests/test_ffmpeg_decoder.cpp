#include <catch2/catch_test_macros.hpp>

#include "audio/ffmpeg_decoder.hpp"
#include "audio/wav_codec.hpp"
#include "test_support.hpp"

#include <chrono>
#include <string>

using namespace testing_support;

TEST_CASE("FfmpegDecoder", "[decoder]") {
    TmpDir dir;
    TmpDir temp_root;
    REQUIRE_FALSE(dir.path.empty());
    REQUIRE_FALSE(temp_root.path.empty());

    auto fixture = dir.file("fixture.wav");
    write_bytes(fixture, wav::encode(tone(1.0, 16000), 16000));
    auto input = dir.file("talk.mp4");
    write_file(input, "not really a video");

    SECTION("DecodesToMono16k") {
        FfmpegDecoder decoder(copying_decoder(dir, fixture), 16000, temp_root.path);
        auto audio = decoder.decode(input, {});
        REQUIRE(audio.has_value());
        REQUIRE(audio->sample_rate == 16000);
        REQUIRE(audio->samples.size() == 16000);
        REQUIRE(audio->duration() == 1.0);
        // Scratch directory is gone.
        REQUIRE(temp_root.entry_count() == 0);
    }

    SECTION("PassesNormalizationArguments") {
        auto args_file = dir.file("args.txt");
        auto script = write_script(dir.file("recording-ffmpeg"),
                                   "echo \"$@\" > \"" + args_file + "\"\n"
                                   "for a in \"$@\"; do out=\"$a\"; done\ncp \"" + fixture + "\" \"$out\"");
        FfmpegDecoder decoder(script, 16000, temp_root.path);
        REQUIRE(decoder.decode(input, {}).has_value());

        auto args = read_file(args_file);
        REQUIRE(args.find("-i " + input) != std::string::npos);
        REQUIRE(args.find("-vn") != std::string::npos);
        REQUIRE(args.find("-ac 1") != std::string::npos);
        REQUIRE(args.find("-ar 16000") != std::string::npos);
        REQUIRE(args.find("-c:a pcm_s16le") != std::string::npos);
    }

    SECTION("MissingExecutable") {
        FfmpegDecoder decoder(dir.file("no-such-ffmpeg"), 16000, temp_root.path);
        auto audio = decoder.decode(input, {});
        REQUIRE_FALSE(audio.has_value());
        REQUIRE(audio.error().kind == ErrorKind::DecoderUnavailable);
    }

    SECTION("UnrunnableExecutable") {
        auto script = dir.file("broken-ffmpeg");
        write_file(script, "#!/nonexistent/interpreter\n");
        ::chmod(script.c_str(), 0755);

        FfmpegDecoder decoder(script, 16000, temp_root.path);
        auto audio = decoder.decode(input, {});
        REQUIRE_FALSE(audio.has_value());
        REQUIRE(audio.error().kind == ErrorKind::DecoderUnavailable);
    }

    SECTION("DecoderRejectsMedia") {
        auto script = write_script(dir.file("failing-ffmpeg"),
                                   "echo 'Invalid data found when processing input' >&2\nexit 1");
        FfmpegDecoder decoder(script, 16000, temp_root.path);
        auto audio = decoder.decode(input, {});
        REQUIRE_FALSE(audio.has_value());
        REQUIRE(audio.error().kind == ErrorKind::UnsupportedMedia);
        REQUIRE(audio.error().message.find("Invalid data found") != std::string::npos);
        REQUIRE(temp_root.entry_count() == 0);
    }

    SECTION("MissingInput") {
        FfmpegDecoder decoder(copying_decoder(dir, fixture), 16000, temp_root.path);
        auto audio = decoder.decode(dir.file("absent.mkv"), {});
        REQUIRE_FALSE(audio.has_value());
        REQUIRE(audio.error().kind == ErrorKind::UnsupportedMedia);
    }

    SECTION("UnreadableOutput") {
        auto script = write_script(dir.file("garbage-ffmpeg"),
                                   "for a in \"$@\"; do out=\"$a\"; done\necho garbage > \"$out\"");
        FfmpegDecoder decoder(script, 16000, temp_root.path);
        auto audio = decoder.decode(input, {});
        REQUIRE_FALSE(audio.has_value());
        REQUIRE(audio.error().kind == ErrorKind::UnsupportedMedia);
    }

    SECTION("WrongSampleRate") {
        auto slow = dir.file("slow.wav");
        write_bytes(slow, wav::encode(tone(1.0, 8000), 8000));
        FfmpegDecoder decoder(copying_decoder(dir, slow), 16000, temp_root.path);
        auto audio = decoder.decode(input, {});
        REQUIRE_FALSE(audio.has_value());
        REQUIRE(audio.error().kind == ErrorKind::DecoderUnavailable);
    }

    SECTION("CancelStopsDecoder") {
        auto script = write_script(dir.file("slow-ffmpeg"), "exec sleep 30");
        FfmpegDecoder decoder(script, 16000, temp_root.path);

        auto started = std::chrono::steady_clock::now();
        auto audio = decoder.decode(input, DecodeOptions{.cancelled = [] { return true; }});
        auto elapsed = std::chrono::steady_clock::now() - started;

        REQUIRE_FALSE(audio.has_value());
        REQUIRE(audio.error().kind == ErrorKind::Cancelled);
        REQUIRE(elapsed < std::chrono::seconds(10));
        REQUIRE(temp_root.entry_count() == 0);
    }
}

TEST_CASE("FfmpegDecoder::find_executable", "[decoder]") {
    REQUIRE_FALSE(FfmpegDecoder::find_executable("sh").empty());
    REQUIRE(FfmpegDecoder::find_executable("no-such-binary-for-transcriber-tests").empty());
    REQUIRE(FfmpegDecoder::find_executable("/bin/sh") == "/bin/sh");
    REQUIRE(FfmpegDecoder::find_executable("").empty());
}
