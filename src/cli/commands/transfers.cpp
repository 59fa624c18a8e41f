#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>

static void report(const Result<std::string>& r, const char* what) {
    if (r.is_err()) print_error(r.error);
    else std::cout << theme::ok(fmt::format("Queued {} {}", what, r.value));
}

static void report(const Result<void>& r, const std::string& id, const char* verb) {
    if (r.is_err()) print_error(r.error);
    else std::cout << theme::ok(fmt::format("{} {}", verb, id));
}

static void report(const std::vector<BatchOutcome>& outcomes, const char* verb) {
    if (outcomes.empty()) {
        std::cout << theme::muted("    nothing to do") << "\n";
        return;
    }
    for (const auto& o : outcomes) report(o.result, o.transfer_id, verb);
}

static void do_put(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;
    auto args = split_args(arg);
    if (args.size() != 2) {
        std::cout << "Usage: put <local> <remote>\n";
        return;
    }
    report(cli.service.enqueue_upload(cli.current_session, args[0], args[1]), "upload");
}

static void do_get(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;
    auto args = split_args(arg);
    if (args.size() != 2) {
        std::cout << "Usage: get <remote> <local>\n";
        return;
    }
    report(cli.service.enqueue_download(cli.current_session, args[0], args[1]), "download");
}

static void do_transfers(BaseCLI& cli, const std::string& arg) {
    auto items = cli.service.list_transfers(arg);
    std::cout << theme::section("Transfers");
    if (items.empty()) {
        std::cout << theme::muted("    none") << "\n\n";
        return;
    }
    for (const auto& t : items) {
        const auto& it = t.item;
        int pct = it.size > 0 ? static_cast<int>(it.transferred * 100 / it.size)
                              : (it.status == TransferStatus::Completed ? 100 : 0);
        std::string indent = it.parent_id.empty() ? "  " : "      ";
        std::string files;
        if (t.aggregate) {
            files = fmt::format(" [{}/{} files]", t.aggregate->completed_files, t.aggregate->total_files);
        }
        std::cout << fmt::format("{}{:<24} {:<8} {:<10} {:>3}% {}{}\n", indent, it.id,
                                 transfer_direction_name(it.direction), transfer_status_name(it.status),
                                 pct, it.name, files);
        if (it.error) std::cout << theme::muted(indent + "    " + it.error->describe()) << "\n";
    }
    std::cout << "\n";
}

static void do_pause(BaseCLI& cli, const std::string& arg) {
    report(cli.service.pause_transfer(arg), arg, "Pausing");
}

static void do_resume(BaseCLI& cli, const std::string& arg) {
    report(cli.service.resume_transfer(arg), arg, "Resumed");
}

static void do_abort(BaseCLI& cli, const std::string& arg) {
    report(cli.service.cancel_transfer(arg), arg, "Cancelling");
}

static void do_forget(BaseCLI& cli, const std::string& arg) {
    report(cli.service.remove_transfer(arg), arg, "Removed");
}

static void do_pause_all(BaseCLI& cli, const std::string&) {
    if (!cli.require_session()) return;
    report(cli.service.batch_pause(cli.current_session), "Pausing");
}

static void do_resume_all(BaseCLI& cli, const std::string&) {
    if (!cli.require_session()) return;
    report(cli.service.batch_resume(cli.current_session), "Resumed");
}

static void do_abort_all(BaseCLI& cli, const std::string&) {
    if (!cli.require_session()) return;
    report(cli.service.batch_cancel(cli.current_session), "Cancelling");
}

static void do_forget_all(BaseCLI& cli, const std::string&) {
    if (!cli.require_session()) return;
    report(cli.service.batch_delete(cli.current_session), "Removed");
}

static void do_clear(BaseCLI& cli, const std::string&) {
    int n = cli.service.clear_transfer_history();
    std::cout << theme::ok(fmt::format("Cleared {} finished transfer(s)", n));
}

static void do_progress(BaseCLI& cli, const std::string& arg) {
    bool on = arg != "off";
    cli.events.set_show_progress(on);
    std::cout << theme::ok(on ? "Progress lines on" : "Progress lines off");
}

void register_transfer_commands(BaseCLI& cli) {
    cli.add_command("put", do_put, "Upload a file or directory");
    cli.add_command("get", do_get, "Download a file or directory");
    cli.add_command("transfers", do_transfers, "List transfers [session-id]");
    cli.add_command("pause", do_pause, "Pause a transfer");
    cli.add_command("resume", do_resume, "Resume a paused, failed or cancelled transfer");
    cli.add_command("abort", do_abort, "Cancel a transfer");
    cli.add_command("forget", do_forget, "Remove a finished or paused transfer");
    cli.add_command("pause-all", do_pause_all, "Pause every running transfer of the session");
    cli.add_command("resume-all", do_resume_all, "Resume every stopped transfer of the session");
    cli.add_command("abort-all", do_abort_all, "Cancel every active transfer of the session");
    cli.add_command("forget-all", do_forget_all, "Remove every inactive transfer of the session");
    cli.add_command("clear", do_clear, "Drop completed, failed and cancelled transfers");
    cli.add_command("progress", do_progress, "Show progress lines (on|off)");
}
