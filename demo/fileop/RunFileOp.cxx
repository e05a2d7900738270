// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "fileop/FileOp.hxx"
#include "fileop/BatchContext.hxx"
#include "fileop/PresetContext.hxx"
#include "fileop/Config.hxx"
#include "fileop/Entry.hxx"
#include "fileop/Interrupt.hxx"
#include "fileop/LocalVfs.hxx"
#include "io/Logger.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/PrintException.hxx"

#include <fmt/format.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <getopt.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

using namespace FileOp;

static InterruptFlags interrupt_flags;

static void
OnSigint(int) noexcept
{
	interrupt_flags.abort = 1;
}

static void
OnSigquit(int) noexcept
{
	interrupt_flags.skip = 1;
}

static void
OnSigusr1(int) noexcept
{
	interrupt_flags.paused = !interrupt_flags.paused;
}

static void
InstallSignalHandler(int signo, void (*handler)(int)) noexcept
{
	struct sigaction sa{};
	sa.sa_handler = handler;
	sa.sa_flags = SA_RESTART;
	sigemptyset(&sa.sa_mask);
	sigaction(signo, &sa, nullptr);
}

/**
 * SIGINT aborts, SIGQUIT skips the file being copied, SIGUSR1
 * toggles pause.
 */
static void
InstallSignalHandlers() noexcept
{
	InstallSignalHandler(SIGINT, OnSigint);
	InstallSignalHandler(SIGQUIT, OnSigquit);
	InstallSignalHandler(SIGUSR1, OnSigusr1);
}

/**
 * Print the question and read one answer character from stdin until
 * it is one of the given keys.
 *
 * @return the key or 0 on end of file
 */
static char
Prompt(std::string_view question, std::string_view keys)
{
	while (true) {
		fmt::print(stderr, "{} ", question);
		fflush(stderr);

		char line[64];
		if (fgets(line, sizeof(line), stdin) == nullptr)
			return 0;

		const char ch = line[0];
		if (ch != 0 && ch != '\n' && keys.find(ch) != keys.npos)
			return ch;
	}
}

/**
 * Asks all questions on the controlling terminal and shows progress
 * on stderr.  Signals are checked at each suspension point: SIGINT
 * aborts (which offers deleting a partial file), SIGQUIT skips the
 * current file and SIGUSR1 pauses until the next SIGUSR1.
 */
class TerminalContext final : public PresetContext {
	const bool show_progress;

public:
	explicit TerminalContext(bool _show_progress) noexcept
		:show_progress(_show_progress) {}

	/* virtual methods from class Context */
	void NotifyCopyStart(const Entry &source, const Entry &target) override {
		fmt::print(stderr, "{} -> {}\n", source.GetPath(), target.GetPath());
	}

	void NotifyMoveStart(const Entry &source, const Entry &target) override {
		fmt::print(stderr, "{} => {}\n", source.GetPath(), target.GetPath());
	}

	void NotifyDeleteStart(const Entry &entry) override {
		fmt::print(stderr, "rm {}\n", entry.GetPath());
	}

	void NotifyFileProgress(uint_least64_t done, uint_least64_t total) override {
		if (!show_progress)
			return;

		const unsigned percent = total > 0 && done < total
			? static_cast<unsigned>(done * 100 / total)
			: 100;
		fmt::print(stderr, "\r{:3}% {}/{}", percent, done, total);
		if (done >= total)
			fmt::print(stderr, "\n");
		fflush(stderr);
	}

	void Start(Operation &operation) override {
		operation.Start();

		while (!operation.IsFinished()) {
			if (interrupt_flags.paused) {
				fmt::print(stderr, "\nPaused, send SIGUSR1 to continue\n");
				WaitWhilePaused(interrupt_flags);
			}

			operation.Resume(NextCommand(interrupt_flags,
						     operation.GetSuspendPoint()));
		}
	}

protected:
	/* virtual methods from class PresetContext */
	IoErrorChoice AskIoError(std::string_view message,
				 bool &for_all) override {
		fmt::print(stderr, "\n{}\n", message);

		switch (Prompt("[s]kip, skip [a]ll, a[b]ort?", "sab")) {
		case 'a':
			for_all = true;
			[[fallthrough]];
		case 's':
			return IoErrorChoice::SKIP;

		default:
			return IoErrorChoice::ABORT;
		}
	}

	OverwriteChoice AskOverwrite(const Entry &source, const Entry &target,
				     bool &for_all) override {
		const auto &src = source.GetStat(), &dst = target.GetStat();
		fmt::print(stderr,
			   "\nTarget file already exists!\n{}\n"
			   "New     : size {}\n"
			   "Existing: size {}\n",
			   target.GetPath(), src.size, dst.size);

		/* reget only makes sense if there is something to
		   append to */
		const bool can_reget = dst.size != 0 && dst.size < src.size;

		const char ch = can_reget
			? Prompt("[y]es, [n]o, [r]eget, [a]ll, [u]pdate, n[o]ne, a[b]ort?",
				 "ynraoub")
			: Prompt("[y]es, [n]o, [a]ll, [u]pdate, n[o]ne, a[b]ort?",
				 "ynaoub");

		switch (ch) {
		case 'y':
			return OverwriteChoice::OVERWRITE;

		case 'n':
			return OverwriteChoice::SKIP;

		case 'r':
			return OverwriteChoice::REGET;

		case 'a':
			for_all = true;
			return OverwriteChoice::OVERWRITE;

		case 'u':
			for_all = true;
			return OverwriteChoice::UPDATE;

		case 'o':
			for_all = true;
			return OverwriteChoice::SKIP;

		default:
			return OverwriteChoice::ABORT;
		}
	}

	PartialChoice AskPartial(const Entry &, const Entry &target) override {
		fmt::print(stderr, "\nIncomplete file was retrieved: {}\n",
			   target.GetPath());

		return Prompt("[d]elete or [k]eep it?", "dk") == 'd'
			? PartialChoice::DELETE
			: PartialChoice::KEEP;
	}

	NonEmptyDirChoice AskNonEmptyDirDeletion(const Entry &entry,
						 bool &for_all) override {
		fmt::print(stderr, "\nDirectory \"{}\" not empty.\n",
			   entry.GetPath());

		switch (Prompt("Delete it recursively? [y]es, [n]o, [a]ll, n[o]ne, a[b]ort?",
			       "ynaob")) {
		case 'a':
			for_all = true;
			[[fallthrough]];
		case 'y':
			return NonEmptyDirChoice::DELETE;

		case 'o':
			for_all = true;
			[[fallthrough]];
		case 'n':
			return NonEmptyDirChoice::SKIP;

		default:
			return NonEmptyDirChoice::ABORT;
		}
	}
};

static void
PrintUsage(const char *argv0)
{
	fmt::print(stderr,
		   "usage: {} [OPTIONS] cp|mv SOURCE... TARGET\n"
		   "       {} [OPTIONS] rm PATH...\n"
		   "\n"
		   "  -b, --batch            never ask, behave like cp/mv/rm\n"
		   "  -p, --preserve         preserve mode, owner and times (default)\n"
		   "  -P, --no-preserve      do not preserve attributes\n"
		   "  -L, --dereference      follow symlinks in sources\n"
		   "  -B, --buffer-size N    transfer N bytes at a time\n"
		   "  -c, --config FILE      load settings from FILE\n"
		   "  -v, --verbose          log more (repeat for even more)\n"
		   "  -h, --help             show this help\n",
		   argv0, argv0);
}

struct CommandLine {
	bool batch = false;
	std::optional<bool> preserve, deref;
	std::optional<std::size_t> buffer_size;
	const char *config_path = nullptr;
	unsigned verbose = 0;

	OperationType type;
	std::vector<std::string> sources;
	std::string target;
};

static std::size_t
ParseBufferSize(const char *s)
{
	char *endptr;
	const unsigned long long value = strtoull(s, &endptr, 10);
	if (endptr == s || *endptr != 0 || value == 0)
		throw FmtInvalidArgument("Invalid buffer size: {}", s);

	if (value > MAX_BUFFER_SIZE)
		throw FmtInvalidArgument("Buffer size is too large: {}", s);

	return value;
}

static OperationType
ParseOperationType(std::string_view s)
{
	if (s == "cp")
		return OperationType::COPY;
	else if (s == "mv")
		return OperationType::MOVE;
	else if (s == "rm")
		return OperationType::DELETE;
	else
		throw FmtInvalidArgument("Unknown command: {}", s);
}

/**
 * @return false if the usage text shall be printed
 */
static bool
ParseCommandLine(CommandLine &cmdline, int argc, char **argv)
{
	static constexpr struct option long_options[] = {
		{"batch", no_argument, nullptr, 'b'},
		{"preserve", no_argument, nullptr, 'p'},
		{"no-preserve", no_argument, nullptr, 'P'},
		{"dereference", no_argument, nullptr, 'L'},
		{"buffer-size", required_argument, nullptr, 'B'},
		{"config", required_argument, nullptr, 'c'},
		{"verbose", no_argument, nullptr, 'v'},
		{"help", no_argument, nullptr, 'h'},
		{nullptr, 0, nullptr, 0},
	};

	int opt;
	while ((opt = getopt_long(argc, argv, "bpPLB:c:vh",
				  long_options, nullptr)) != -1) {
		switch (opt) {
		case 'b':
			cmdline.batch = true;
			break;

		case 'p':
			cmdline.preserve = true;
			break;

		case 'P':
			cmdline.preserve = false;
			break;

		case 'L':
			cmdline.deref = true;
			break;

		case 'B':
			cmdline.buffer_size = ParseBufferSize(optarg);
			break;

		case 'c':
			cmdline.config_path = optarg;
			break;

		case 'v':
			++cmdline.verbose;
			break;

		default:
			return false;
		}
	}

	if (optind >= argc)
		return false;

	cmdline.type = ParseOperationType(argv[optind++]);

	const std::size_t min_args =
		cmdline.type == OperationType::DELETE ? 1 : 2;
	if (static_cast<std::size_t>(argc - optind) < min_args)
		return false;

	int end = argc;
	if (cmdline.type != OperationType::DELETE)
		cmdline.target = argv[--end];

	cmdline.sources.assign(argv + optind, argv + end);
	return true;
}

static void
ApplyCommandLine(ContextOptions &options, const CommandLine &cmdline) noexcept
{
	if (cmdline.preserve)
		options.preserve = *cmdline.preserve;
	if (cmdline.deref)
		options.deref = *cmdline.deref;
	if (cmdline.buffer_size)
		options.buffer_size = *cmdline.buffer_size;
}

static std::unique_ptr<Context>
MakeContext(const CommandLine &cmdline)
{
	Config config;
	if (cmdline.config_path != nullptr)
		LoadConfigFile(config, cmdline.config_path);

	ApplyCommandLine(config.options, cmdline);

	if (cmdline.batch) {
		auto ctx = std::make_unique<BatchContext>(config.options);
		ctx->SetInterruptFlags(interrupt_flags);
		return ctx;
	}

	const bool interactive = isatty(STDIN_FILENO);

	auto ctx = std::make_unique<TerminalContext>(interactive &&
						     isatty(STDERR_FILENO));
	config.ApplyTo(*ctx);

	if (!interactive) {
		LogFmt(2, "fileop", "stdin is not a terminal, not asking");
		ctx->SetPassive();
	}

	return ctx;
}

static OperationResult
RunCommand(Context &ctx, const CommandLine &cmdline)
{
	switch (cmdline.type) {
	case OperationType::COPY:
		return Copy(ctx, cmdline.sources, cmdline.target);

	case OperationType::MOVE:
		return Move(ctx, cmdline.sources, cmdline.target);

	case OperationType::DELETE:
		break;
	}

	return Delete(ctx, cmdline.sources);
}

int
main(int argc, char **argv) noexcept
try {
	CommandLine cmdline;
	if (!ParseCommandLine(cmdline, argc, argv)) {
		PrintUsage(argv[0]);
		return EXIT_FAILURE;
	}

	SetLogLevel(1 + cmdline.verbose);

	auto ctx = MakeContext(cmdline);

	InstallSignalHandlers();

	if (RunCommand(*ctx, cmdline) != OperationResult::COMPLETED) {
		fmt::print(stderr, "Aborted\n");
		return EXIT_FAILURE;
	}

	return EXIT_SUCCESS;
} catch (const std::exception &e) {
	PrintException(e);
	return EXIT_FAILURE;
}
