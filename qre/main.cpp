#include "qre.hpp"
#include "../lib/log.h"

#include <cstdio>
#include <cstring>
#include <string>
#include <unistd.h>

#define QRE_EXIT_MATCH     0
#define QRE_EXIT_NO_MATCH  1
#define QRE_EXIT_USAGE     2

static void print_help(const char* prog) {
    printf("qre - readable patterns compiled to regular expressions\n\n");
    printf("Usage: %s [options] <pattern> <string>\n", prog);
    printf("\nOptions:\n");
    printf("  --regex            Also print the generated regular expression\n");
    printf("  -i, --ignore-case  Match without regard to letter case\n");
    printf("  --flexible-spaces  Let a space in the pattern match a run of spaces\n");
    printf("  -h, --help         Show this help message\n");
    printf("\nExit status: 0 on match, 1 on no match, 2 on usage or pattern errors\n");
    printf("\nExamples:\n");
    printf("  %s \"[folder]/[filename].[extension]\" \"test/123.pdf\"\n", prog);
    printf("  %s --regex \"[year:int]-[month:int]\" \"2021-01\"\n", prog);
}

static void print_result(const qre::MatchResult& result) {
    std::string json = "{";
    bool first = true;
    for (const auto& entry : result) {
        if (!first) json += ", ";
        first = false;
        json += qre::json_quote(entry.first);
        json += ": ";
        json += entry.second.to_json();
    }
    json += "}";
    printf("%s\n", json.c_str());

    if (!result.unnamed().empty()) {
        std::string list = "[";
        for (size_t i = 0; i < result.unnamed().size(); i++) {
            if (i) list += ", ";
            list += result.unnamed()[i].to_json();
        }
        list += "]";
        printf("Unnamed groups: %s\n", list.c_str());
    }
}

int main(int argc, char* argv[]) {
    // Initialize logging system with config file if available
    if (access("log.conf", F_OK) == 0) {
        if (log_parse_config_file("log.conf") != LOG_OK) {
            fprintf(stderr, "Warning: Failed to parse log.conf, using defaults\n");
        }
    }
    log_init("");

    bool show_regex = false;
    qre::MatcherOptions options;
    const char* pattern = nullptr;
    const char* input = nullptr;

    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_help(argv[0]);
            log_fini();
            return QRE_EXIT_MATCH;
        } else if (strcmp(argv[i], "--regex") == 0) {
            show_regex = true;
        } else if (strcmp(argv[i], "-i") == 0 || strcmp(argv[i], "--ignore-case") == 0) {
            options.case_sensitive = false;
        } else if (strcmp(argv[i], "--flexible-spaces") == 0) {
            options.flexible_spaces = true;
        } else if (strcmp(argv[i], "--") == 0) {
            // everything after -- is positional
            for (i++; i < argc; i++) {
                if (!pattern) pattern = argv[i];
                else if (!input) input = argv[i];
            }
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            fprintf(stderr, "Error: Unknown option '%s'\n", argv[i]);
            log_fini();
            return QRE_EXIT_USAGE;
        } else if (!pattern) {
            pattern = argv[i];
        } else if (!input) {
            input = argv[i];
        } else {
            fprintf(stderr, "Error: Unexpected argument '%s'\n", argv[i]);
            log_fini();
            return QRE_EXIT_USAGE;
        }
    }

    if (!pattern || !input) {
        fprintf(stderr, "Error: a pattern and a string are required\n");
        fprintf(stderr, "Try '%s --help' for more information\n", argv[0]);
        log_fini();
        return QRE_EXIT_USAGE;
    }

    log_category_t* cli_log = log_get_category("qre");
    clog_debug(cli_log, "main: pattern '%s', input '%s'", pattern, input);
    int exit_code;
    try {
        qre::Matcher matcher(pattern, options);
        qre::MatchResult result = matcher.match(input);
        clog_info(cli_log, "%s: %s", matcher.regex().c_str(), result ? "match" : "no match");
        if (result) print_result(result);
        if (show_regex) printf("Regex: %s\n", matcher.regex().c_str());
        exit_code = result ? QRE_EXIT_MATCH : QRE_EXIT_NO_MATCH;
    } catch (const qre::Error& e) {
        fprintf(stderr, "Error [%s]: %s\n", qre::err_code_name(e.code()), e.what());
        exit_code = QRE_EXIT_USAGE;
    }

    log_fini();
    return exit_code;
}
