#include "workspace.hpp"
#include "test_support.hpp"

int main()
{
    TestRun run("workspace");

    try
    {
        RecordingDiagnostics diagnostics;

        run.check(WorkingArea::segmentFileName(0) == "segment_000.ts", "first slot name is zero-padded");
        run.check(WorkingArea::segmentFileName(42) == "segment_042.ts", "slot names use three digits");
        run.check(WorkingArea::segmentFileName(1234) == "segment_1234.ts", "larger indices are not truncated");

        auto first = WorkingArea::create(diagnostics);
        auto second = WorkingArea::create(diagnostics);
        run.check(first->exists() && second->exists(), "working areas are created on disk");
        run.check(first->path() != second->path(), "each working area is unique");
        run.check(first->path().filename().string().rfind("video_segments_", 0) == 0, "default prefix applied");

        auto custom = WorkingArea::create(diagnostics, "video_transcript_");
        run.check(custom->path().filename().string().rfind("video_transcript_", 0) == 0, "custom prefix applied");

        // Slots written out of order, with gaps and unrelated files
        writeFile(first->segmentPath(10), "k");
        writeFile(first->segmentPath(2), "c");
        writeFile(first->segmentPath(0), "a");
        writeFile(first->path() / "file_list.txt", "ignored");
        writeFile(first->path() / "segment_abc.ts", "ignored");
        std::filesystem::create_directory(first->path() / "segment_005.ts");

        auto files = first->segmentFiles();
        run.check(files.size() == 3, "only numbered slot files are listed");
        run.check(files.size() == 3 && files[0].filename() == "segment_000.ts" &&
                      files[1].filename() == "segment_002.ts" && files[2].filename() == "segment_010.ts",
                  "slot files sorted by index, gaps skipped");
        run.check(!files.empty() && files.front().is_absolute(), "slot files are absolute paths");

        std::filesystem::path firstPath = first->path();
        run.check(first->destroy(), "destroy succeeds");
        run.check(!std::filesystem::exists(firstPath), "destroy removes the directory and its files");
        run.check(first->destroy(), "second destroy is a no-op success");
        run.check(diagnostics.contains(Diagnostics::Level::Info, "Cleaned up temporary files"),
                  "cleanup is logged");

        // Directory removed behind our back still counts as cleaned
        std::filesystem::remove_all(second->path());
        run.check(second->destroy(), "destroying an already missing directory succeeds");

        std::filesystem::path customPath = custom->path();
        custom.reset();
        run.check(!std::filesystem::exists(customPath), "destructor removes the directory");
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }

    return run.finish();
}
