// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "TempDir.hxx"
#include "RecordingContext.hxx"
#include "FaultyVfs.hxx"
#include "fileop/FileOp.hxx"
#include "fileop/BatchContext.hxx"

#include <gtest/gtest.h>

#include <fcntl.h>
#include <stdio.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace FileOp;

TEST(CopyTest, NewFile)
{
	TempDir tmp;
	WriteFile(tmp("a"), "hello world");

	RecordingContext ctx;
	FaultyVfs vfs;
	EXPECT_EQ(Copy(ctx, vfs, tmp("a"), tmp("b")), OperationResult::COMPLETED);

	EXPECT_EQ(ReadFile(tmp("b")), "hello world");
	EXPECT_EQ(ReadFile(tmp("a")), "hello world");
	EXPECT_TRUE(ctx.io_errors.empty());
	EXPECT_TRUE(ctx.overwrite_questions.empty());
	ASSERT_EQ(ctx.started.size(), 1u);
	EXPECT_EQ(ctx.started.front(), tmp("a") + " -> " + tmp("b"));
	ASSERT_FALSE(ctx.progress.empty());
	EXPECT_EQ(ctx.progress.back(), 11u);
}

TEST(CopyTest, ChunkSuspension)
{
	TempDir tmp;
	WriteFile(tmp("a"), "0123456789");

	RecordingContext ctx;
	ctx.options.buffer_size = 4;
	FaultyVfs vfs;
	EXPECT_EQ(Copy(ctx, vfs, tmp("a"), tmp("b")), OperationResult::COMPLETED);

	EXPECT_EQ(ReadFile(tmp("b")), "0123456789");

	/* the allocation is rounded up to a whole page, but only 4
	   bytes are transferred at a time */
	EXPECT_EQ(ctx.progress, (std::vector<uint_least64_t>{4, 8, 10}));
	EXPECT_EQ(ctx.suspend_points,
		  (std::vector<SuspendPoint>{SuspendPoint::CHUNK,
					     SuspendPoint::CHUNK,
					     SuspendPoint::CHUNK}));
}

TEST(CopyTest, IntoDirectory)
{
	TempDir tmp;
	WriteFile(tmp("a"), "foo");
	WriteFile(tmp("b"), "bar");
	MakeDirectory(tmp("dir"));

	RecordingContext ctx;
	FaultyVfs vfs;
	const std::vector<std::string> sources{tmp("a"), tmp("b")};
	EXPECT_EQ(Copy(ctx, vfs, sources, tmp("dir")), OperationResult::COMPLETED);

	EXPECT_EQ(ReadFile(tmp("dir/a")), "foo");
	EXPECT_EQ(ReadFile(tmp("dir/b")), "bar");
}

TEST(CopyTest, ParallelLists)
{
	TempDir tmp;
	WriteFile(tmp("a"), "foo");
	WriteFile(tmp("b"), "bar");

	RecordingContext ctx;
	FaultyVfs vfs;
	const std::vector<std::string> sources{tmp("a"), tmp("b")};
	const std::vector<std::string> targets{tmp("x"), tmp("y")};
	EXPECT_EQ(Copy(ctx, vfs, sources, targets), OperationResult::COMPLETED);

	EXPECT_EQ(ReadFile(tmp("x")), "foo");
	EXPECT_EQ(ReadFile(tmp("y")), "bar");
}

TEST(CopyTest, LengthMismatch)
{
	TempDir tmp;
	WriteFile(tmp("a"), "foo");
	WriteFile(tmp("b"), "bar");

	RecordingContext ctx;
	FaultyVfs vfs;
	const std::vector<std::string> sources{tmp("a"), tmp("b")};
	const std::vector<std::string> targets{tmp("x")};
	EXPECT_THROW(Copy(ctx, vfs, sources, targets), std::invalid_argument);

	/* nothing was touched */
	EXPECT_FALSE(PathExists(tmp("x")));
	EXPECT_TRUE(ctx.started.empty());
	EXPECT_EQ(vfs.n_bytes_read, 0u);
}

TEST(CopyTest, OverwriteIsIdempotent)
{
	TempDir tmp;
	WriteFile(tmp("a"), "hello world");

	RecordingContext ctx;
	FaultyVfs vfs;
	EXPECT_EQ(Copy(ctx, vfs, tmp("a"), tmp("b")), OperationResult::COMPLETED);
	EXPECT_EQ(Copy(ctx, vfs, tmp("a"), tmp("b")), OperationResult::COMPLETED);

	EXPECT_EQ(ReadFile(tmp("b")), "hello world");
	EXPECT_EQ(ctx.overwrite_questions,
		  (std::vector<std::string>{tmp("b")}));
	EXPECT_TRUE(ctx.io_errors.empty());
}

TEST(CopyTest, OverwriteSkip)
{
	TempDir tmp;
	WriteFile(tmp("a"), "new");
	WriteFile(tmp("b"), "old");

	RecordingContext ctx;
	ctx.overwrite = OverwriteChoice::SKIP;
	FaultyVfs vfs;
	EXPECT_EQ(Copy(ctx, vfs, tmp("a"), tmp("b")), OperationResult::COMPLETED);

	EXPECT_EQ(ReadFile(tmp("b")), "old");
	EXPECT_EQ(vfs.n_bytes_read, 0u);
}

TEST(CopyTest, OverwriteAbort)
{
	TempDir tmp;
	WriteFile(tmp("a"), "new");
	WriteFile(tmp("b"), "old");
	WriteFile(tmp("c"), "c");

	RecordingContext ctx;
	ctx.overwrite = OverwriteChoice::ABORT;
	FaultyVfs vfs;
	const std::vector<std::string> sources{tmp("a"), tmp("c")};
	const std::vector<std::string> targets{tmp("b"), tmp("d")};
	EXPECT_EQ(Copy(ctx, vfs, sources, targets), OperationResult::ABORTED);

	EXPECT_EQ(ReadFile(tmp("b")), "old");
	EXPECT_FALSE(PathExists(tmp("d")));
}

static void
SetModificationTime(const std::string &path, time_t t)
{
	const struct timespec times[2]{{t, 0}, {t, 0}};
	ASSERT_EQ(utimensat(AT_FDCWD, path.c_str(), times, 0), 0);
}

TEST(CopyTest, Update)
{
	TempDir tmp;
	WriteFile(tmp("a"), "new");
	WriteFile(tmp("b"), "old");

	RecordingContext ctx;
	ctx.overwrite = OverwriteChoice::UPDATE;
	FaultyVfs vfs;

	/* the target is newer: skip */
	SetModificationTime(tmp("a"), 1000);
	SetModificationTime(tmp("b"), 2000);
	EXPECT_EQ(Copy(ctx, vfs, tmp("a"), tmp("b")), OperationResult::COMPLETED);
	EXPECT_EQ(ReadFile(tmp("b")), "old");

	/* same time: skip */
	SetModificationTime(tmp("b"), 1000);
	EXPECT_EQ(Copy(ctx, vfs, tmp("a"), tmp("b")), OperationResult::COMPLETED);
	EXPECT_EQ(ReadFile(tmp("b")), "old");

	/* the source is newer: overwrite */
	SetModificationTime(tmp("a"), 3000);
	EXPECT_EQ(Copy(ctx, vfs, tmp("a"), tmp("b")), OperationResult::COMPLETED);
	EXPECT_EQ(ReadFile(tmp("b")), "new");
}

TEST(CopyTest, Reget)
{
	TempDir tmp;
	WriteFile(tmp("a"), "hello world");
	WriteFile(tmp("b"), "hello ");

	RecordingContext ctx;
	ctx.overwrite = OverwriteChoice::REGET;
	FaultyVfs vfs;
	EXPECT_EQ(Copy(ctx, vfs, tmp("a"), tmp("b")), OperationResult::COMPLETED);

	EXPECT_EQ(ReadFile(tmp("b")), "hello world");

	/* the existing prefix was not read again */
	EXPECT_EQ(vfs.min_read_offset, 6u);
	EXPECT_EQ(vfs.n_bytes_read, 5u);
	ASSERT_FALSE(ctx.progress.empty());
	EXPECT_EQ(ctx.progress.back(), 11u);
}

TEST(CopyTest, RegetWithoutSeek)
{
	TempDir tmp;
	WriteFile(tmp("a"), "hello world");
	WriteFile(tmp("b"), "HELLO ");

	RecordingContext ctx;
	ctx.overwrite = OverwriteChoice::REGET;
	FaultyVfs vfs;
	vfs.fail_seek = true;
	EXPECT_EQ(Copy(ctx, vfs, tmp("a"), tmp("b")), OperationResult::COMPLETED);

	/* fell back to copying everything */
	EXPECT_EQ(ReadFile(tmp("b")), "hello world");
	EXPECT_EQ(vfs.min_read_offset, 0u);
	EXPECT_TRUE(ctx.io_errors.empty());
}

TEST(CopyTest, SameFile)
{
	TempDir tmp;
	WriteFile(tmp("a"), "precious");

	RecordingContext ctx;
	FaultyVfs vfs;
	ASSERT_TRUE(vfs.Link(tmp("a").c_str(), tmp("b").c_str()));
	EXPECT_EQ(Copy(ctx, vfs, tmp("a"), tmp("b")), OperationResult::COMPLETED);

	EXPECT_EQ(ReadFile(tmp("a")), "precious");
	ASSERT_EQ(ctx.io_errors.size(), 1u);
	EXPECT_EQ(ctx.io_errors.front(),
		  "\"" + tmp("a") + "\"\nand\n\"" + tmp("b") + "\"\nare the same file");
	EXPECT_EQ(vfs.n_bytes_read, 0u);
	EXPECT_TRUE(ctx.progress.empty());
}

TEST(CopyTest, SameFileAbort)
{
	TempDir tmp;
	WriteFile(tmp("a"), "precious");

	RecordingContext ctx;
	ctx.io_error = IoErrorChoice::ABORT;
	FaultyVfs vfs;
	EXPECT_EQ(Copy(ctx, vfs, tmp("a"), tmp("a")), OperationResult::ABORTED);

	EXPECT_EQ(ReadFile(tmp("a")), "precious");
	EXPECT_EQ(ctx.io_errors.size(), 1u);
}

TEST(CopyTest, PartialDeleteOnAbort)
{
	TempDir tmp;
	WriteFile(tmp("a"), "0123456789abcdef");

	RecordingContext ctx;
	ctx.options.buffer_size = 4;
	ctx.script = {ResumeCommand::ABORT};
	ctx.partial = PartialChoice::DELETE;
	FaultyVfs vfs;
	EXPECT_EQ(Copy(ctx, vfs, tmp("a"), tmp("b")), OperationResult::ABORTED);

	EXPECT_FALSE(PathExists(tmp("b")));
	EXPECT_EQ(ctx.partial_questions, (std::vector<std::string>{tmp("b")}));
	EXPECT_EQ(ctx.progress, (std::vector<uint_least64_t>{4}));
}

TEST(CopyTest, PartialKeepOnAbort)
{
	TempDir tmp;
	WriteFile(tmp("a"), "0123456789abcdef");

	RecordingContext ctx;
	ctx.options.buffer_size = 4;
	ctx.script = {ResumeCommand::ABORT};
	ctx.partial = PartialChoice::KEEP;
	FaultyVfs vfs;
	EXPECT_EQ(Copy(ctx, vfs, tmp("a"), tmp("b")), OperationResult::ABORTED);

	EXPECT_EQ(ReadFile(tmp("b")), "0123");
}

TEST(CopyTest, ReadErrorOffersPartialDelete)
{
	TempDir tmp;
	WriteFile(tmp("a"), "0123456789abcdef");

	RecordingContext ctx;
	ctx.options.buffer_size = 4;
	ctx.partial = PartialChoice::DELETE;
	FaultyVfs vfs;
	vfs.fail_read_at = 8;
	EXPECT_EQ(Copy(ctx, vfs, tmp("a"), tmp("b")), OperationResult::COMPLETED);

	ASSERT_EQ(ctx.io_errors.size(), 1u);
	EXPECT_EQ(ctx.io_errors.front(),
		  "Cannot read source file \"" + tmp("a") +
		  "\"\nInput/output error");
	EXPECT_EQ(ctx.partial_questions, (std::vector<std::string>{tmp("b")}));
	EXPECT_FALSE(PathExists(tmp("b")));
	EXPECT_EQ(ReadFile(tmp("a")), "0123456789abcdef");
}

TEST(CopyTest, WriteErrorKeepsPartial)
{
	TempDir tmp;
	WriteFile(tmp("a"), "0123456789abcdef");

	RecordingContext ctx;
	ctx.options.buffer_size = 4;
	ctx.partial = PartialChoice::KEEP;
	FaultyVfs vfs;
	vfs.fail_write_at = 4;
	EXPECT_EQ(Copy(ctx, vfs, tmp("a"), tmp("b")), OperationResult::COMPLETED);

	ASSERT_EQ(ctx.io_errors.size(), 1u);
	EXPECT_EQ(ctx.io_errors.front(),
		  "Cannot write target file \"" + tmp("b") +
		  "\"\nNo space left on device");
	EXPECT_EQ(ctx.partial_questions, (std::vector<std::string>{tmp("b")}));
	EXPECT_EQ(ReadFile(tmp("b")), "0123");
}

TEST(CopyTest, WriteErrorAbort)
{
	TempDir tmp;
	WriteFile(tmp("a"), "0123456789abcdef");
	WriteFile(tmp("c"), "second");

	RecordingContext ctx;
	ctx.options.buffer_size = 4;
	ctx.io_error = IoErrorChoice::ABORT;
	ctx.partial = PartialChoice::DELETE;
	FaultyVfs vfs;
	vfs.fail_write_at = 4;
	const std::vector<std::string> sources{tmp("a"), tmp("c")};
	const std::vector<std::string> targets{tmp("b"), tmp("d")};
	EXPECT_EQ(Copy(ctx, vfs, sources, targets), OperationResult::ABORTED);

	EXPECT_EQ(ctx.partial_questions, (std::vector<std::string>{tmp("b")}));
	EXPECT_FALSE(PathExists(tmp("b")));
	EXPECT_FALSE(PathExists(tmp("d")));
}

TEST(CopyTest, CloseErrorOffersPartialDelete)
{
	TempDir tmp;
	WriteFile(tmp("a"), "hello");

	RecordingContext ctx;
	ctx.partial = PartialChoice::DELETE;
	FaultyVfs vfs;
	vfs.fail_close = true;
	EXPECT_EQ(Copy(ctx, vfs, tmp("a"), tmp("b")), OperationResult::COMPLETED);

	ASSERT_EQ(ctx.io_errors.size(), 1u);
	EXPECT_EQ(ctx.io_errors.front(),
		  "Cannot close target file \"" + tmp("b") +
		  "\"\nInput/output error");
	EXPECT_EQ(ctx.partial_questions, (std::vector<std::string>{tmp("b")}));
	EXPECT_FALSE(PathExists(tmp("b")));
}

TEST(CopyTest, BufferAllocationFailureKeepsTarget)
{
	TempDir tmp;
	WriteFile(tmp("a"), "new contents");
	WriteFile(tmp("b"), "precious old contents");

	RecordingContext ctx;
	/* more than any address space can hold */
	ctx.options.buffer_size = std::size_t{1} << 50;
	FaultyVfs vfs;
	EXPECT_EQ(Copy(ctx, vfs, tmp("a"), tmp("b")), OperationResult::COMPLETED);

	EXPECT_EQ(ReadFile(tmp("b")), "precious old contents");
	ASSERT_EQ(ctx.io_errors.size(), 1u);
	EXPECT_EQ(ctx.io_errors.front(),
		  "Cannot allocate a transfer buffer for \"" + tmp("a") +
		  "\"\nCannot allocate memory");
	EXPECT_TRUE(ctx.partial_questions.empty());
	EXPECT_EQ(vfs.n_bytes_read, 0u);
}

TEST(CopyTest, BufferAllocationFailureAbort)
{
	TempDir tmp;
	WriteFile(tmp("a"), "new contents");
	WriteFile(tmp("b"), "precious old contents");

	RecordingContext ctx;
	ctx.options.buffer_size = std::size_t{1} << 50;
	ctx.io_error = IoErrorChoice::ABORT;
	FaultyVfs vfs;
	EXPECT_EQ(Copy(ctx, vfs, tmp("a"), tmp("b")), OperationResult::ABORTED);

	EXPECT_EQ(ReadFile(tmp("b")), "precious old contents");
}

TEST(CopyTest, SkipContinuesWithNext)
{
	TempDir tmp;
	WriteFile(tmp("a"), "0123456789abcdef");
	WriteFile(tmp("c"), "second");

	RecordingContext ctx;
	ctx.options.buffer_size = 4;
	ctx.script = {ResumeCommand::SKIP};
	FaultyVfs vfs;
	const std::vector<std::string> sources{tmp("a"), tmp("c")};
	const std::vector<std::string> targets{tmp("b"), tmp("d")};
	EXPECT_EQ(Copy(ctx, vfs, sources, targets), OperationResult::COMPLETED);

	EXPECT_FALSE(PathExists(tmp("b")));
	EXPECT_EQ(ReadFile(tmp("d")), "second");
	EXPECT_EQ(ctx.partial_questions.size(), 1u);
}

TEST(CopyTest, MissingSource)
{
	TempDir tmp;
	WriteFile(tmp("c"), "c");

	RecordingContext ctx;
	FaultyVfs vfs;
	const std::vector<std::string> sources{tmp("missing"), tmp("c")};
	EXPECT_EQ(Copy(ctx, vfs, sources, tmp("dir")), OperationResult::COMPLETED);

	ASSERT_EQ(ctx.io_errors.size(), 1u);
	EXPECT_EQ(ctx.io_errors.front(),
		  "Cannot stat source file \"" + tmp("missing") +
		  "\"\nNo such file or directory");

	/* "dir" did not exist, so the second source was copied to
	   that name */
	EXPECT_EQ(ReadFile(tmp("dir")), "c");
}

TEST(CopyTest, OpenErrorAbort)
{
	TempDir tmp;
	WriteFile(tmp("a"), "a");
	WriteFile(tmp("c"), "c");

	RecordingContext ctx;
	ctx.io_error = IoErrorChoice::ABORT;
	FaultyVfs vfs;
	vfs.fail_open.insert(tmp("a"));

	const std::vector<std::string> sources{tmp("a"), tmp("c")};
	const std::vector<std::string> targets{tmp("b"), tmp("d")};
	EXPECT_EQ(Copy(ctx, vfs, sources, targets), OperationResult::ABORTED);

	ASSERT_EQ(ctx.io_errors.size(), 1u);
	EXPECT_EQ(ctx.io_errors.front(),
		  "Cannot open source file \"" + tmp("a") +
		  "\"\nPermission denied");
	EXPECT_FALSE(PathExists(tmp("b")));
	EXPECT_FALSE(PathExists(tmp("d")));
}

TEST(CopyTest, CreateErrorSkip)
{
	TempDir tmp;
	WriteFile(tmp("a"), "a");

	RecordingContext ctx;
	FaultyVfs vfs;
	vfs.fail_open.insert(tmp("b"));
	EXPECT_EQ(Copy(ctx, vfs, tmp("a"), tmp("b")), OperationResult::COMPLETED);

	ASSERT_EQ(ctx.io_errors.size(), 1u);
	EXPECT_EQ(ctx.io_errors.front(),
		  "Cannot create target file \"" + tmp("b") +
		  "\"\nPermission denied");
}

TEST(CopyTest, InvalidChoice)
{
	TempDir tmp;
	WriteFile(tmp("a"), "a");
	WriteFile(tmp("b"), "b");

	RecordingContext ctx;
	ctx.overwrite = static_cast<OverwriteChoice>(42);
	FaultyVfs vfs;
	EXPECT_THROW(Copy(ctx, vfs, tmp("a"), tmp("b")), FileOp::InvalidChoice);
	EXPECT_EQ(ReadFile(tmp("b")), "b");
}

TEST(CopyTest, DirectoryTree)
{
	TempDir tmp;
	MakeDirectory(tmp("src"));
	MakeDirectory(tmp("src/sub"));
	WriteFile(tmp("src/a"), "a");
	WriteFile(tmp("src/sub/b"), "b");

	RecordingContext ctx;
	FaultyVfs vfs;
	EXPECT_EQ(Copy(ctx, vfs, tmp("src"), tmp("dst")), OperationResult::COMPLETED);

	EXPECT_EQ(ReadFile(tmp("dst/a")), "a");
	EXPECT_EQ(ReadFile(tmp("dst/sub/b")), "b");

	/* again: now "dst" exists, so "src" is copied into it */
	EXPECT_EQ(Copy(ctx, vfs, tmp("src"), tmp("dst")), OperationResult::COMPLETED);
	EXPECT_EQ(ReadFile(tmp("dst/src/sub/b")), "b");
	EXPECT_TRUE(ctx.io_errors.empty());
}

TEST(CopyTest, ReadOnlyDirectoryPreserved)
{
	TempDir tmp;
	MakeDirectory(tmp("src"));
	WriteFile(tmp("src/a"), "a");
	WriteFile(tmp("src/b"), "b");
	ASSERT_EQ(chmod(tmp("src").c_str(), 0555), 0);

	RecordingContext ctx;
	ctx.options.preserve = true;
	FaultyVfs vfs;
	EXPECT_EQ(Copy(ctx, vfs, tmp("src"), tmp("dst")), OperationResult::COMPLETED);

	EXPECT_TRUE(ctx.io_errors.empty());
	EXPECT_EQ(ReadFile(tmp("dst/a")), "a");
	EXPECT_EQ(ReadFile(tmp("dst/b")), "b");
	EXPECT_EQ(GetMode(tmp("dst")), 0555);
}

TEST(CopyTest, PreserveMode)
{
	TempDir tmp;
	WriteFile(tmp("a"), "a");
	ASSERT_EQ(chmod(tmp("a").c_str(), 0640), 0);
	SetModificationTime(tmp("a"), 1234567);

	RecordingContext ctx;
	ctx.options.preserve = true;
	FaultyVfs vfs;
	EXPECT_EQ(Copy(ctx, vfs, tmp("a"), tmp("b")), OperationResult::COMPLETED);

	EXPECT_EQ(GetMode(tmp("b")), 0640);

	struct stat st;
	ASSERT_EQ(stat(tmp("b").c_str(), &st), 0);
	EXPECT_EQ(st.st_mtime, 1234567);
}

TEST(CopyTest, TargetMustBeDirectory)
{
	TempDir tmp;
	MakeDirectory(tmp("src"));
	WriteFile(tmp("src/a"), "a");
	WriteFile(tmp("file"), "file");

	RecordingContext ctx;
	FaultyVfs vfs;
	EXPECT_EQ(Copy(ctx, vfs, tmp("src"), tmp("file")), OperationResult::COMPLETED);

	ASSERT_EQ(ctx.io_errors.size(), 1u);
	EXPECT_EQ(ctx.io_errors.front(),
		  "Destination \"" + tmp("file") + "\" must be a directory");
	EXPECT_EQ(ReadFile(tmp("file")), "file");
}

TEST(CopyTest, Symlink)
{
	TempDir tmp;
	MakeDirectory(tmp("src"));
	ASSERT_EQ(symlink("nowhere", tmp("src/link").c_str()), 0);

	RecordingContext ctx;
	FaultyVfs vfs;
	EXPECT_EQ(Copy(ctx, vfs, tmp("src"), tmp("dst")), OperationResult::COMPLETED);

	char buffer[64];
	const auto length = readlink(tmp("dst/link").c_str(), buffer, sizeof(buffer));
	ASSERT_GT(length, 0);
	EXPECT_EQ(std::string_view(buffer, length), "nowhere");
}

TEST(CopyTest, Dereference)
{
	TempDir tmp;
	WriteFile(tmp("a"), "a");
	ASSERT_EQ(symlink(tmp("a").c_str(), tmp("link").c_str()), 0);

	RecordingContext ctx;
	ctx.options.deref = true;
	FaultyVfs vfs;
	EXPECT_EQ(Copy(ctx, vfs, tmp("link"), tmp("b")), OperationResult::COMPLETED);

	struct stat st;
	ASSERT_EQ(lstat(tmp("b").c_str(), &st), 0);
	EXPECT_TRUE(S_ISREG(st.st_mode));
	EXPECT_EQ(ReadFile(tmp("b")), "a");
}

TEST(CopyTest, Special)
{
	TempDir tmp;
	ASSERT_EQ(mkfifo(tmp("fifo").c_str(), 0600), 0);

	RecordingContext ctx;
	FaultyVfs vfs;
	EXPECT_EQ(Copy(ctx, vfs, tmp("fifo"), tmp("b")), OperationResult::COMPLETED);

	EXPECT_EQ(ctx.io_errors,
		  (std::vector<std::string>{"I don't know how to copy files of type 'special'"}));
	EXPECT_FALSE(PathExists(tmp("b")));
}

TEST(CopyTest, Batch)
{
	TempDir tmp;
	WriteFile(tmp("a"), "a");
	WriteFile(tmp("b"), "old");

	FILE *out = tmpfile();
	ASSERT_NE(out, nullptr);

	{
		BatchContext ctx{out};
		FaultyVfs vfs;
		const std::vector<std::string> sources{tmp("a"), tmp("missing")};
		const std::vector<std::string> targets{tmp("b"), tmp("c")};
		EXPECT_EQ(Copy(ctx, vfs, sources, targets), OperationResult::COMPLETED);
	}

	EXPECT_EQ(ReadFile(tmp("b")), "a");

	rewind(out);
	char buffer[1024];
	const std::size_t length = fread(buffer, 1, sizeof(buffer), out);
	fclose(out);

	EXPECT_EQ(std::string_view(buffer, length),
		  tmp("a") + " -> " + tmp("b") + "\n");
}
