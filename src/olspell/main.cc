// Copyright 2010 University of Helsinki
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include <getopt.h>

#include <clocale>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>

#include "ZHfstSpeller.h"
#include "buffer.h"
#include "hfst-ol.h"
#include "ospell.h"

using olspell::ZHfstSpeller;
using olspell::StringWeightVector;

namespace {

const int EXIT_USAGE = 2;

struct Options
{
    bool analyse;
    bool suggest_reals;
    bool dump_metadata;
    bool verbose;
    std::string lexicon;
    std::string errmodel;
    std::string archive;

    Options() :
        analyse(false),
        suggest_reals(false),
        dump_metadata(false),
        verbose(false)
    {}
};

void
print_usage(const char* program)
{
    fprintf(stdout,
            "Usage: %s [OPTIONS] ARCHIVE.zhfst\n"
            "       %s [OPTIONS] -l LEXICON [-e ERRMODEL]\n"
            "Check spelling of words read from standard input, one per line,\n"
            "and suggest corrections for misspelled ones\n"
            "\n"
            "  -h, --help               Print this help message\n"
            "  -l, --lexicon=FILE       Use the hfstol lexicon in FILE\n"
            "  -e, --errmodel=FILE      Use the hfstol error model in FILE\n"
            "  -n, --limit=N            Show at most N suggestions\n"
            "  -w, --max-weight=W       Suppress corrections heavier than W\n"
            "  -b, --beam=B             Suppress corrections heavier than best + B\n"
            "  -t, --time-cutoff=S      Stop searching after S seconds\n"
            "  -x, --epsilon-bound=N    Allow N steps in a row without input\n"
            "  -X, --no-case-handling   Do not try case variants of words\n"
            "  -a, --analyse            Analyse words and corrections\n"
            "  -S, --suggest-reals      Suggest corrections for correct words too\n"
            "  -m, --metadata           Print the archive metadata and exit\n"
            "  -v, --verbose            Print search statistics on stderr\n",
            program, program);
}

bool
parse_double(const char* arg, double& value)
{
    char* end = NULL;
    value = strtod(arg, &end);
    return end != arg && *end == '\0';
}

bool
parse_unsigned(const char* arg, unsigned long& value)
{
    char* end = NULL;
    if (*arg == '-') {
        return false;
    }
    value = strtoul(arg, &end, 10);
    return end != arg && *end == '\0';
}

void
print_statistics(const std::string& word, const olspell::CorrectionResult& r)
{
    fprintf(stderr, "%s: %lu nodes expanded, %lu cycle-bound prunes, "
            "%lu flag rejections, %lu memo discards\n",
            word.c_str(), r.stats.nodes_expanded, r.stats.cycle_bound_prunes,
            r.stats.flag_rejections, r.stats.memo_discards);
    if (r.status == olspell::TimeLimit) {
        fprintf(stderr, "%s: search stopped by time limit\n", word.c_str());
    }
}

void
do_suggest(const ZHfstSpeller& speller, const Options& options,
           const std::string& str)
{
    olspell::CorrectionResult result =
        speller.get_speller()->correct(str, speller.get_config());
    if (options.verbose) {
        print_statistics(str, result);
    }
    const StringWeightVector& corrections = result.corrections;
    if (corrections.empty()) {
        printf("Unable to correct \"%s\"!\n\n", str.c_str());
        return;
    }
    printf("Corrections for \"%s\":\n", str.c_str());
    for (StringWeightVector::const_iterator c = corrections.begin();
         c != corrections.end(); ++c) {
        if (!options.analyse) {
            printf("%s    %f\n", c->first.c_str(), c->second);
            continue;
        }
        StringWeightVector anals = speller.analyse(c->first, true);
        bool all_discarded = true;
        for (StringWeightVector::const_iterator a = anals.begin();
             a != anals.end(); ++a) {
            if (a->first.find("Use/SpellNoSugg") != std::string::npos) {
                printf("%s    %f    %s    [DISCARDED BY ANALYSES]\n",
                       c->first.c_str(), c->second, a->first.c_str());
            } else {
                all_discarded = false;
                printf("%s    %f    %s\n",
                       c->first.c_str(), c->second, a->first.c_str());
            }
        }
        if (all_discarded) {
            printf("All corrections were invalidated by analysis! No score!\n");
        }
    }
    printf("\n");
}

void
do_spell(const ZHfstSpeller& speller, const Options& options,
         const std::string& str)
{
    if (!speller.spell(str)) {
        printf("\"%s\" is NOT in the lexicon:\n", str.c_str());
        if (speller.can_correct()) {
            do_suggest(speller, options, str);
        }
        return;
    }
    printf("\"%s\" is in the lexicon...\n", str.c_str());
    if (options.analyse) {
        printf("analysing:\n");
        StringWeightVector anals = speller.analyse(str, false);
        bool all_no_spell = true;
        for (StringWeightVector::const_iterator a = anals.begin();
             a != anals.end(); ++a) {
            if (a->first.find("Use/-Spell") != std::string::npos) {
                printf("%s   %f [DISCARDED AS -Spell]\n",
                       a->first.c_str(), a->second);
            } else {
                all_no_spell = false;
                printf("%s   %f\n", a->first.c_str(), a->second);
            }
        }
        if (all_no_spell) {
            printf("All spellings were invalidated by analysis! .:. Not in lexicon!\n");
        }
    }
    if (options.suggest_reals && speller.can_correct()) {
        printf("\"%s\" (but correcting anyways)\n", str.c_str());
        do_suggest(speller, options, str);
    }
}

void
load(ZHfstSpeller& speller, const Options& options)
{
    if (!options.archive.empty()) {
        speller.read_zhfst(options.archive);
        return;
    }
    olspell::ByteBufferPtr errmodel;
    if (!options.errmodel.empty()) {
        errmodel = olspell::map_file(options.errmodel);
    }
    speller.read_transducers(olspell::map_file(options.lexicon), errmodel);
}

} // anonymous namespace

int
main(int argc, char** argv)
{
    setlocale(LC_ALL, "");
    Options options;
    ZHfstSpeller speller;

    const struct option long_options[] =
    {
        {"help",             no_argument,       0, 'h'},
        {"lexicon",          required_argument, 0, 'l'},
        {"errmodel",         required_argument, 0, 'e'},
        {"limit",            required_argument, 0, 'n'},
        {"max-weight",       required_argument, 0, 'w'},
        {"beam",             required_argument, 0, 'b'},
        {"time-cutoff",      required_argument, 0, 't'},
        {"epsilon-bound",    required_argument, 0, 'x'},
        {"no-case-handling", no_argument,       0, 'X'},
        {"analyse",          no_argument,       0, 'a'},
        {"suggest-reals",    no_argument,       0, 'S'},
        {"metadata",         no_argument,       0, 'm'},
        {"verbose",          no_argument,       0, 'v'},
        {0,                  0,                 0,  0 }
    };
    int c = 0;
    while ((c = getopt_long(argc, argv, "hl:e:n:w:b:t:x:XaSmv",
                            long_options, NULL)) != -1) {
        double real = 0.0;
        unsigned long count = 0;
        switch (c) {
        case 'h':
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        case 'l':
            options.lexicon = optarg;
            break;
        case 'e':
            options.errmodel = optarg;
            break;
        case 'n':
            if (!parse_unsigned(optarg, count)) {
                fprintf(stderr, "%s: invalid suggestion limit %s\n", argv[0], optarg);
                return EXIT_USAGE;
            }
            speller.set_queue_limit(count);
            break;
        case 'w':
            if (!parse_double(optarg, real)) {
                fprintf(stderr, "%s: invalid weight %s\n", argv[0], optarg);
                return EXIT_USAGE;
            }
            speller.set_weight_limit(static_cast<olspell::Weight>(real));
            break;
        case 'b':
            if (!parse_double(optarg, real)) {
                fprintf(stderr, "%s: invalid beam %s\n", argv[0], optarg);
                return EXIT_USAGE;
            }
            speller.set_beam(static_cast<olspell::Weight>(real));
            break;
        case 't':
            if (!parse_double(optarg, real)) {
                fprintf(stderr, "%s: invalid time cutoff %s\n", argv[0], optarg);
                return EXIT_USAGE;
            }
            speller.set_time_cutoff(real);
            break;
        case 'x':
            if (!parse_unsigned(optarg, count)) {
                fprintf(stderr, "%s: invalid epsilon bound %s\n", argv[0], optarg);
                return EXIT_USAGE;
            }
            speller.set_max_epsilon_steps(static_cast<unsigned int>(count));
            break;
        case 'X':
            speller.set_case_handling(false);
            break;
        case 'a':
            options.analyse = true;
            break;
        case 'S':
            options.suggest_reals = true;
            break;
        case 'm':
            options.dump_metadata = true;
            break;
        case 'v':
            options.verbose = true;
            break;
        default:
            print_usage(argv[0]);
            return EXIT_USAGE;
        }
    }
    if (optind < argc) {
        options.archive = argv[optind++];
    }
    if (optind < argc ||
        options.archive.empty() == options.lexicon.empty() ||
        (!options.errmodel.empty() && options.lexicon.empty())) {
        fprintf(stderr, "%s: give either an archive or a lexicon\n", argv[0]);
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    try {
        load(speller, options);
    } catch (const olspell::ZHfstException& e) {
        fprintf(stderr, "%s: cannot read speller: %s\n", argv[0], e.what());
        return EXIT_FAILURE;
    } catch (const olspell::FormatError& e) {
        fprintf(stderr, "%s: cannot read automaton: %s\n", argv[0], e.what());
        return EXIT_FAILURE;
    } catch (const olspell::FileOpeningException& e) {
        fprintf(stderr, "%s: %s\n", argv[0], e.what());
        return EXIT_FAILURE;
    } catch (const olspell::AlphabetTranslationException& e) {
        fprintf(stderr, "%s: error model symbol %s does not fit the lexicon\n",
                argv[0], e.what());
        return EXIT_FAILURE;
    }

    if (options.dump_metadata) {
        printf("%s", speller.metadata_dump().c_str());
        return EXIT_SUCCESS;
    }

    std::string line;
    while (std::getline(std::cin, line)) {
        if (!line.empty() && line[line.size() - 1] == '\r') {
            line.erase(line.size() - 1);
        }
        if (line.empty()) {
            continue;
        }
        do_spell(speller, options, line);
    }
    return EXIT_SUCCESS;
}
