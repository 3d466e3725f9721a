/**
 * klog - Command Runner Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "CommandRunner.hpp"

#include "store/EntryCodec.hpp"
#include "store/EntryStore.hpp"
#include "store/StoreErrors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>

#include <spdlog/spdlog.h>

namespace klog {

namespace {

std::optional<size_t> parseOrdinal(const std::string& value) {
    if (value.empty() || value.size() > 9 ||
        !std::all_of(value.begin(), value.end(),
            [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::stoul(value));
}

std::string readLocalFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IOFailure(path, "cannot open file for reading");
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw IOFailure(path, "read error");
    }
    return content;
}

} // anonymous namespace

CommandRunner::CommandRunner(EntryStore& store, std::istream& in, std::ostream& out, std::ostream& err)
    : m_store(store)
    , m_in(in)
    , m_out(out)
    , m_err(err) {
}

std::string CommandRunner::usage() {
    return "Commands:\n"
           "  list                       list entries with their numbers\n"
           "  show <n>                   print entry n\n"
           "  template [YYYY-MM-DD]      print a template for a new entry\n"
           "  new <file|->               create an entry from text\n"
           "  edit <n> <file|->          replace entry n with text\n"
           "  remove <n>                 delete entry n\n"
           "  attach <n> <file>          attach a file to entry n\n"
           "  detach <n> <m>             remove attachment m from entry n\n";
}

ExitCode CommandRunner::run(const std::vector<std::string>& args) {
    if (args.empty()) {
        m_err << usage();
        return ExitCode::UsageError;
    }

    const std::string& command = args[0];
    std::vector<std::string> rest(args.begin() + 1, args.end());

    try {
        if (command == "list") return list();
        if (command == "show") return show(rest);
        if (command == "template") return printTemplate(rest);
        if (command == "new") return create(rest);
        if (command == "edit") return edit(rest);
        if (command == "remove") return remove(rest);
        if (command == "attach") return attach(rest);
        if (command == "detach") return detach(rest);
    } catch (const FormatError& e) {
        m_err << "Invalid entry: " << e.what() << "\n";
        return ExitCode::FormatFailure;
    } catch (const IOFailure& e) {
        spdlog::error("{} failed: {}", command, e.what());
        m_err << e.what() << "\n";
        return ExitCode::IoFailure;
    }

    m_err << "Unknown command: " << command << "\n" << usage();
    return ExitCode::UsageError;
}

ExitCode CommandRunner::list() {
    auto years = m_store.entriesByYear();
    if (years.empty()) {
        m_out << "No entries\n";
        return ExitCode::Success;
    }

    for (const auto& [year, entries] : years) {
        m_out << year << "\n";
        for (const LogEntry* entry : entries) {
            m_out << "  [" << m_store.ordinalOf(entry).value_or(0) << "] "
                  << entry->summaryLine();
            if (!entry->media().empty()) {
                m_out << " (" << entry->media().size() << " media)";
            }
            m_out << "\n";
        }
    }
    return ExitCode::Success;
}

ExitCode CommandRunner::show(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        m_err << "show <n>\n";
        return ExitCode::UsageError;
    }

    LogEntry* entry = lookup(args[0]);
    if (!entry) {
        return ExitCode::UsageError;
    }

    m_out << entry->currentText();
    return ExitCode::Success;
}

ExitCode CommandRunner::printTemplate(const std::vector<std::string>& args) {
    if (args.size() > 1) {
        m_err << "template [YYYY-MM-DD]\n";
        return ExitCode::UsageError;
    }

    Date date = Date::today();
    if (args.size() == 1) {
        auto parsed = Date::parse(args[0]);
        if (!parsed) {
            m_err << "Bad date: " << args[0] << "\n";
            return ExitCode::UsageError;
        }
        date = *parsed;
    }

    m_out << EntryCodec::templateText(date, m_store.placeholderTopic());
    return ExitCode::Success;
}

ExitCode CommandRunner::create(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        m_err << "new <file|->\n";
        return ExitCode::UsageError;
    }

    std::string text = readInput(args[0]);

    // Validate before the blank entry joins the store; reload() would
    // refuse MEDIA lines only after that
    EntryFields fields = EntryCodec::parse(text);
    if (!fields.media.empty()) {
        throw FormatError("direct adding of media is not supported");
    }

    LogEntry& entry = m_store.createEntry(fields.begin);
    entry.reload(text);
    return commitChanges("Created " + entry.summaryLine());
}

ExitCode CommandRunner::edit(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        m_err << "edit <n> <file|->\n";
        return ExitCode::UsageError;
    }

    LogEntry* entry = lookup(args[0]);
    if (!entry) {
        return ExitCode::UsageError;
    }

    std::string text = readInput(args[1]);
    if (EntryCodec::normalize(text) == entry->currentText()) {
        m_out << "Nothing changed\n";
        return ExitCode::Success;
    }

    entry->reload(text);
    return commitChanges("Modified " + entry->summaryLine());
}

ExitCode CommandRunner::remove(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        m_err << "remove <n>\n";
        return ExitCode::UsageError;
    }

    LogEntry* entry = lookup(args[0]);
    if (!entry) {
        return ExitCode::UsageError;
    }

    entry->markForRemoval();
    return commitChanges("Removed " + entry->summaryLine());
}

ExitCode CommandRunner::attach(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        m_err << "attach <n> <file>\n";
        return ExitCode::UsageError;
    }

    LogEntry* entry = lookup(args[0]);
    if (!entry) {
        return ExitCode::UsageError;
    }

    std::filesystem::path source(args[1]);
    entry->attach(source.filename().string(), readLocalFile(source));
    return commitChanges("Attached " + source.filename().string() + " to " + entry->summaryLine());
}

ExitCode CommandRunner::detach(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        m_err << "detach <n> <m>\n";
        return ExitCode::UsageError;
    }

    LogEntry* entry = lookup(args[0]);
    if (!entry) {
        return ExitCode::UsageError;
    }

    auto mediaOrdinal = parseOrdinal(args[1]);
    if (!mediaOrdinal || !entry->detachByOrdinal(*mediaOrdinal)) {
        m_err << "No attachment " << args[1] << " on " << entry->summaryLine() << "\n";
        return ExitCode::UsageError;
    }

    return commitChanges("Detached media from " + entry->summaryLine());
}

LogEntry* CommandRunner::lookup(const std::string& ordinal) {
    auto index = parseOrdinal(ordinal);
    LogEntry* entry = index ? m_store.entryByOrdinal(*index) : nullptr;
    if (!entry || entry->isRemoved()) {
        m_err << "No entry " << ordinal << "\n";
        return nullptr;
    }
    return entry;
}

std::string CommandRunner::readInput(const std::string& source) {
    if (source == "-") {
        return std::string((std::istreambuf_iterator<char>(m_in)),
                           std::istreambuf_iterator<char>());
    }
    return readLocalFile(source);
}

ExitCode CommandRunner::commitChanges(const std::string& action) {
    CommitResult result = m_store.commit();
    if (!result.succeeded()) {
        for (const auto& failure : result.failures) {
            m_err << "Failed to save " << failure.summary << ": " << failure.message << "\n";
        }
        return ExitCode::IoFailure;
    }

    m_out << action << "\n";
    return ExitCode::Success;
}

} // namespace klog
