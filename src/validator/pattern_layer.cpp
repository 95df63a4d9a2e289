#include "validator/validation_layers.hpp"

#include <algorithm>
#include <cctype>

#include "utils/common.hpp"

namespace sandbar::validator {
namespace {

using K = ViolationKind;

const std::vector<DenyPattern> kPythonPatterns = {
    {K::kProcessAccess, "import os"},
    {K::kProcessAccess, "from os "},
    {K::kProcessAccess, "os.system"},
    {K::kProcessAccess, "os.popen"},
    {K::kProcessAccess, "os.exec"},
    {K::kProcessAccess, "os.spawn"},
    {K::kProcessAccess, "os.fork"},
    {K::kProcessAccess, "os.kill"},
    {K::kProcessAccess, "subprocess"},
    {K::kProcessAccess, "multiprocessing"},
    {K::kProcessAccess, "import pty", true},
    {K::kProcessAccess, "import sys"},
    {K::kProcessAccess, "from sys "},
    {K::kFilesystemAccess, "open(", true},
    {K::kFilesystemAccess, "file(", true},
    {K::kFilesystemAccess, "shutil"},
    {K::kFilesystemAccess, "pathlib"},
    {K::kFilesystemAccess, "os.remove"},
    {K::kFilesystemAccess, "os.unlink"},
    {K::kFilesystemAccess, "os.listdir"},
    {K::kFilesystemAccess, "tempfile"},
    {K::kFilesystemAccess, "glob.", true},
    {K::kNetworkAccess, "socket"},
    {K::kNetworkAccess, "urllib"},
    {K::kNetworkAccess, "http.client"},
    {K::kNetworkAccess, "import requests"},
    {K::kNetworkAccess, "requests.", true},
    {K::kNetworkAccess, "httpx"},
    {K::kNetworkAccess, "aiohttp"},
    {K::kNetworkAccess, "ftplib"},
    {K::kNetworkAccess, "smtplib"},
    {K::kNetworkAccess, "telnetlib"},
    {K::kDynamicEvaluation, "eval(", true},
    {K::kDynamicEvaluation, "exec(", true},
    {K::kDynamicEvaluation, "compile(", true},
    {K::kDynamicEvaluation, "execfile("},
    {K::kDynamicEvaluation, "__import__"},
    {K::kDynamicEvaluation, "importlib"},
    {K::kDynamicEvaluation, "runpy"},
    {K::kDynamicEvaluation, "pickle"},
    {K::kDynamicEvaluation, "marshal"},
    {K::kDynamicEvaluation, "ctypes"},
    {K::kPrivilegeEscalation, "setuid"},
    {K::kPrivilegeEscalation, "setgid"},
    {K::kPrivilegeEscalation, "sudo", true},
    {K::kRuntimeGlobals, "globals(", true},
    {K::kRuntimeGlobals, "locals(", true},
    {K::kRuntimeGlobals, "vars(", true},
    {K::kRuntimeGlobals, "builtins"},
    {K::kRuntimeGlobals, "sys.modules"},
    {K::kRuntimeGlobals, "breakpoint("},
    {K::kIntrospection, "getattr("},
    {K::kIntrospection, "setattr("},
    {K::kIntrospection, "delattr("},
    {K::kIntrospection, "dir(", true},
    {K::kIntrospection, "inspect", true},
    {K::kIntrospection, "gc.get_objects"},
    {K::kIntrospection, "sys._getframe"},
    {K::kIntrospection, "f_globals"},
    {K::kIntrospection, "f_locals"},
    {K::kIntrospection, "f_back"},
    {K::kIntrospection, "gi_frame"},
    {K::kIntrospection, "co_code"},
};

const std::vector<DenyPattern> kJavaScriptPatterns = {
    {K::kProcessAccess, "child_process"},
    {K::kProcessAccess, "process.", true},
    {K::kProcessAccess, "worker_threads"},
    {K::kProcessAccess, "cluster.fork"},
    {K::kFilesystemAccess, "require('fs')"},
    {K::kFilesystemAccess, "require(\"fs\")"},
    {K::kFilesystemAccess, "fs.", true},
    {K::kFilesystemAccess, "fs/promises"},
    {K::kFilesystemAccess, "readfilesync"},
    {K::kFilesystemAccess, "writefilesync"},
    {K::kFilesystemAccess, "__dirname"},
    {K::kFilesystemAccess, "__filename"},
    {K::kNetworkAccess, "xmlhttprequest"},
    {K::kNetworkAccess, "websocket"},
    {K::kNetworkAccess, "require('http"},
    {K::kNetworkAccess, "require(\"http"},
    {K::kNetworkAccess, "require('net')"},
    {K::kNetworkAccess, "require(\"net\")"},
    {K::kNetworkAccess, "net.connect"},
    {K::kNetworkAccess, "http.request"},
    {K::kNetworkAccess, "https.request"},
    {K::kNetworkAccess, "dgram"},
    {K::kDynamicEvaluation, "eval(", true},
    {K::kDynamicEvaluation, "Function(", true, true},
    {K::kDynamicEvaluation, "new function"},
    {K::kDynamicEvaluation, "settimeout("},
    {K::kDynamicEvaluation, "setinterval("},
    {K::kDynamicEvaluation, "setimmediate("},
    {K::kDynamicEvaluation, "vm.run"},
    {K::kDynamicEvaluation, "import("},
    {K::kRuntimeGlobals, "global.", true},
    {K::kRuntimeGlobals, "globalthis"},
    {K::kRuntimeGlobals, "window.", true},
    {K::kRuntimeGlobals, "document.", true},
    {K::kRuntimeGlobals, "require.cache"},
    {K::kRuntimeGlobals, "require.main"},
    {K::kRuntimeGlobals, "module.constructor"},
    {K::kIntrospection, "__proto__"},
    {K::kIntrospection, "constructor.constructor"},
    {K::kIntrospection, "getprototypeof"},
    {K::kIntrospection, "prototype."},
    {K::kPrivilegeEscalation, "setuid"},
    {K::kPrivilegeEscalation, "setgid"},
};

const std::vector<DenyPattern> kShellPatterns = {
    {K::kShellInjection, ";rm"},
    {K::kShellInjection, "; rm"},
    {K::kShellInjection, "&&rm"},
    {K::kShellInjection, "&& rm"},
    {K::kShellInjection, "|rm"},
    {K::kShellInjection, "| rm"},
    {K::kShellInjection, "`"},
    {K::kShellInjection, "$("},
    {K::kShellInjection, "|sh", true},
    {K::kShellInjection, "| sh", true},
    {K::kShellInjection, "|bash"},
    {K::kShellInjection, "| bash"},
    {K::kShellInjection, "xargs"},
    {K::kProcessAccess, "kill", true},
    {K::kProcessAccess, "killall"},
    {K::kProcessAccess, "pkill"},
    {K::kProcessAccess, "nohup"},
    {K::kProcessAccess, "disown"},
    {K::kProcessAccess, ":(){"},
    {K::kProcessAccess, "exec", true},
    {K::kFilesystemAccess, "rm", true},
    {K::kFilesystemAccess, "rm -rf"},
    {K::kFilesystemAccess, "mkfs"},
    {K::kFilesystemAccess, "dd", true},
    {K::kFilesystemAccess, "fdisk"},
    {K::kFilesystemAccess, "mount", true},
    {K::kFilesystemAccess, "umount"},
    {K::kFilesystemAccess, "ln -s"},
    {K::kFilesystemAccess, "shred"},
    {K::kFilesystemAccess, "truncate"},
    {K::kFilesystemAccess, "/etc/"},
    {K::kFilesystemAccess, "/proc/"},
    {K::kFilesystemAccess, "/sys/"},
    {K::kFilesystemAccess, "/dev/"},
    {K::kNetworkAccess, "curl"},
    {K::kNetworkAccess, "wget"},
    {K::kNetworkAccess, "nc", true},
    {K::kNetworkAccess, "ncat"},
    {K::kNetworkAccess, "netcat"},
    {K::kNetworkAccess, "ssh", true},
    {K::kNetworkAccess, "scp", true},
    {K::kNetworkAccess, "telnet"},
    {K::kNetworkAccess, "/dev/tcp"},
    {K::kNetworkAccess, "/dev/udp"},
    {K::kNetworkAccess, "ping", true},
    {K::kPrivilegeEscalation, "sudo"},
    {K::kPrivilegeEscalation, "su", true},
    {K::kPrivilegeEscalation, "chmod"},
    {K::kPrivilegeEscalation, "chown"},
    {K::kPrivilegeEscalation, "chgrp"},
    {K::kPrivilegeEscalation, "passwd"},
    {K::kPrivilegeEscalation, "useradd"},
    {K::kPrivilegeEscalation, "userdel"},
    {K::kPrivilegeEscalation, "usermod"},
    {K::kPrivilegeEscalation, "groupadd"},
    {K::kPrivilegeEscalation, "groupdel"},
    {K::kPrivilegeEscalation, "setcap"},
    {K::kPrivilegeEscalation, "crontab"},
    {K::kDynamicEvaluation, "eval", true},
    {K::kDynamicEvaluation, "bash -c"},
    {K::kDynamicEvaluation, "sh -c", true},
    {K::kDynamicEvaluation, "python", true},
    {K::kDynamicEvaluation, "perl", true},
    {K::kDynamicEvaluation, "node", true},
    {K::kRuntimeGlobals, "ld_preload"},
    {K::kRuntimeGlobals, "bash_env"},
    {K::kRuntimeGlobals, "ulimit"},
};

bool IsWordChar(char c) {
    return IsIdentifierChar(c);
}

bool BoundaryOk(std::string_view haystack, std::size_t at, std::string_view needle) {
    if (IsWordChar(needle.front()) && at > 0 && IsWordChar(haystack[at - 1])) {
        return false;
    }
    const auto end = at + needle.size();
    if (IsWordChar(needle.back()) && end < haystack.size() && IsWordChar(haystack[end])) {
        return false;
    }
    return true;
}

bool IsLoopbackHost(std::string_view host) {
    const auto lowered = utils::ToLower(host);
    return lowered == "localhost" || lowered == "127.0.0.1" || lowered == "[::1]";
}

// Host part of a URL starting at `at` (just past "://").
std::string_view HostAt(std::string_view text, std::size_t at) {
    std::size_t end = at;
    if (end < text.size() && text[end] == '[') {
        while (end < text.size() && text[end] != ']') {
            ++end;
        }
        return text.substr(at, std::min(end + 1, text.size()) - at);
    }
    while (end < text.size()) {
        const char c = text[end];
        if (c == '/' || c == ':' || c == '\'' || c == '"' || c == '`' || c == '?' ||
            c == ' ' || c == '\t' || c == '\n' || c == ')') {
            break;
        }
        ++end;
    }
    return text.substr(at, end - at);
}

void CheckUrls(std::string_view text, std::vector<Violation>& violations) {
    std::size_t pos = 0;
    while ((pos = text.find("://", pos)) != std::string_view::npos) {
        std::size_t scheme_start = pos;
        while (scheme_start > 0 && std::isalpha(static_cast<unsigned char>(text[scheme_start - 1]))) {
            --scheme_start;
        }
        if (scheme_start < pos && !IsLoopbackHost(HostAt(text, pos + 3))) {
            violations.push_back(MakeViolation(
                Layer::kPattern, ViolationKind::kNetworkAccess, "url", text,
                scheme_start, pos + 3 - scheme_start + HostAt(text, pos + 3).size()));
        }
        pos += 3;
    }
}

// fetch('http://localhost:...') stays inside the sandbox's own loopback.
bool IsLoopbackFetch(std::string_view text, std::size_t at) {
    std::size_t pos = at + std::string_view("fetch(").size();
    while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t')) {
        ++pos;
    }
    if (pos >= text.size() || (text[pos] != '\'' && text[pos] != '"' && text[pos] != '`')) {
        return false;
    }
    ++pos;
    const auto rest = text.substr(pos);
    for (std::string_view scheme : {"http://", "https://"}) {
        if (rest.substr(0, scheme.size()) == scheme) {
            return IsLoopbackHost(HostAt(rest, scheme.size()));
        }
    }
    return false;
}

}  // namespace

const std::vector<DenyPattern>& DenyPatterns(sandbox::Language language) {
    switch (language) {
        case sandbox::Language::kPython: return kPythonPatterns;
        case sandbox::Language::kJavaScript: return kJavaScriptPatterns;
        case sandbox::Language::kShell: return kShellPatterns;
    }
    return kPythonPatterns;
}

std::vector<Violation> CheckPatterns(const SourceUnit& unit) {
    std::vector<Violation> violations;
    const auto text = unit.text;
    const auto lowered = utils::ToLower(text);
    for (const auto& pattern : DenyPatterns(unit.language)) {
        const std::string_view haystack = pattern.case_sensitive ? text : std::string_view(lowered);
        const auto needle = pattern.case_sensitive ? std::string(pattern.needle) : utils::ToLower(pattern.needle);
        std::size_t pos = 0;
        while ((pos = haystack.find(needle, pos)) != std::string_view::npos) {
            if (!pattern.whole_word || BoundaryOk(haystack, pos, needle)) {
                violations.push_back(MakeViolation(
                    Layer::kPattern, pattern.kind, std::string(pattern.needle), text, pos, needle.size()));
                break;
            }
            ++pos;
        }
    }

    if (unit.language == sandbox::Language::kJavaScript) {
        std::size_t pos = 0;
        while ((pos = lowered.find("fetch(", pos)) != std::string::npos) {
            if (BoundaryOk(lowered, pos, "fetch(") && !IsLoopbackFetch(text, pos)) {
                violations.push_back(MakeViolation(
                    Layer::kPattern, ViolationKind::kNetworkAccess, "fetch(", text, pos, 6));
                break;
            }
            ++pos;
        }
    }
    CheckUrls(text, violations);

    std::stable_sort(violations.begin(), violations.end(), [](const Violation& a, const Violation& b) {
        return a.offset < b.offset;
    });
    return violations;
}

}  // namespace sandbar::validator
