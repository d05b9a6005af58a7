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

#include "ZHfstSpeller.h"

// C
#include <archive.h>
#include <archive_entry.h>
#include <cstdio>
// C++
#include <string>
#include <map>

using std::string;
using std::map;

namespace olspell
{

namespace {

typedef map<string, HfstTransducerPtr> TransducerMap;

string
error_of(archive* ar)
{
    const char* message = archive_error_string(ar);
    return message != NULL ? string(message) : string("unknown error");
}

// closes and frees the reader however the reading ends
class ArchiveReader
{
public:
    ArchiveReader() : ar_(archive_read_new())
    {
        if (ar_ == NULL)
        {
            throw ZHfstZipReadingError("Could not allocate archive reader");
        }
        archive_read_support_filter_all(ar_);
        archive_read_support_format_all(ar_);
    }
    ~ArchiveReader()
    {
        archive_read_close(ar_);
        archive_read_free(ar_);
    }
    archive* get() const { return ar_; }
private:
    ArchiveReader(const ArchiveReader&);
    ArchiveReader& operator=(const ArchiveReader&);

    archive* ar_;
};

string
extract_to_mem(archive* ar, archive_entry* entry)
{
    string buff;
    if (archive_entry_size_is_set(entry))
    {
        buff.reserve(static_cast<size_t>(archive_entry_size(entry)));
    }
    char block[16384];
    for (;;)
    {
        la_ssize_t curr = archive_read_data(ar, block, sizeof(block));
        if (0 == curr)
        {
            break;
        }
        else if (ARCHIVE_RETRY == curr || ARCHIVE_WARN == curr)
        {
            continue;
        }
        else if (curr < 0)
        {
            throw ZHfstZipReadingError(string("Archive broken: ") +
                                       error_of(ar));
        }
        buff.append(block, static_cast<size_t>(curr));
    }
    if (buff.empty())
    {
        throw ZHfstZipReadingError(string("Reading archive resulted in zero "
                                          "length entry ") +
                                   archive_entry_pathname(entry));
    }
    return buff;
}

HfstTransducerPtr
transducer_to_mem(archive* ar, archive_entry* entry)
{
    ByteBufferPtr bytes(new MemoryBuffer(extract_to_mem(ar, entry)));
    return HfstTransducerPtr(new HfstTransducer(bytes));
}

// acceptor.default.hfst -> default
string
descr_of(const string& filename, const string& prefix)
{
    string rest = filename.substr(prefix.size());
    return rest.substr(0, rest.find('.'));
}

bool
starts_with(const string& s, const string& prefix)
{
    return s.compare(0, prefix.size(), prefix) == 0;
}

} // anonymous namespace

ZHfstSpeller::ZHfstSpeller()
{
}

void
ZHfstSpeller::set_queue_limit(unsigned long limit)
{
    config_.n_best = limit;
}

void
ZHfstSpeller::set_weight_limit(Weight limit)
{
    config_.max_weight = limit;
}

void
ZHfstSpeller::set_beam(Weight beam)
{
    config_.beam = beam;
}

void
ZHfstSpeller::set_time_cutoff(double time_cutoff)
{
    config_.time_cutoff = time_cutoff;
}

void
ZHfstSpeller::set_case_handling(bool case_handling)
{
    config_.case_handling = case_handling;
}

void
ZHfstSpeller::set_max_epsilon_steps(unsigned int steps)
{
    config_.max_epsilon_steps = steps;
}

const SpellerConfig&
ZHfstSpeller::get_config() const
{
    return config_;
}

bool
ZHfstSpeller::can_spell() const
{
    return current_speller_.get() != NULL;
}

bool
ZHfstSpeller::can_correct() const
{
    return current_speller_.get() != NULL && current_speller_->can_correct();
}

std::shared_ptr<const Speller>
ZHfstSpeller::get_speller() const
{
    return current_speller_;
}

bool
ZHfstSpeller::spell(const string& wordform) const
{
    if (!can_spell())
    {
        return false;
    }
    return current_speller_->check(wordform, config_);
}

StringWeightVector
ZHfstSpeller::suggest(const string& wordform) const
{
    if (!can_correct())
    {
        return StringWeightVector();
    }
    return current_speller_->correct(wordform, config_).corrections;
}

StringWeightVector
ZHfstSpeller::suggest(const string& wordform, unsigned long max_count,
                      Weight beam) const
{
    if (!can_correct())
    {
        return StringWeightVector();
    }
    SpellerConfig config(config_);
    config.n_best = max_count;
    config.beam = beam;
    return current_speller_->correct(wordform, config).corrections;
}

StringWeightVector
ZHfstSpeller::analyse(const string& wordform, bool ask_sugger) const
{
    if ((ask_sugger && !can_correct()) || !can_spell())
    {
        return StringWeightVector();
    }
    return current_speller_->analyse(wordform, config_);
}

AnalysisCorrectionVector
ZHfstSpeller::suggest_analyses(const string& wordform) const
{
    AnalysisCorrectionVector rv;
    StringWeightVector corrections = suggest(wordform);
    for (StringWeightVector::const_iterator c = corrections.begin();
         c != corrections.end(); ++c)
    {
        StringWeightVector analyses = analyse(c->first, true);
        for (StringWeightVector::const_iterator a = analyses.begin();
             a != analyses.end(); ++a)
        {
            rv.push_back(StringPairWeightPair(StringPair(c->first, a->first),
                                              a->second));
        }
    }
    return rv;
}

void
ZHfstSpeller::read_transducers(ByteBufferPtr lexicon, ByteBufferPtr errmodel)
{
    if (!lexicon)
    {
        throw ZHfstException("No lexicon automaton given");
    }
    HfstTransducerPtr acceptor(new HfstTransducer(lexicon));
    HfstTransducerPtr mutator;
    if (errmodel)
    {
        mutator.reset(new HfstTransducer(errmodel));
    }
    current_speller_.reset(new Speller(mutator, acceptor));
}

void
ZHfstSpeller::select_speller(const TransducerMap& acceptors,
                             const TransducerMap& errmodels)
{
    if (acceptors.empty())
    {
        throw ZHfstZipReadingError("No automata found in zip");
    }
    TransducerMap::const_iterator acceptor = acceptors.find("default");
    TransducerMap::const_iterator errmodel = errmodels.find("default");
    if (acceptor != acceptors.end() && errmodel != errmodels.end())
    {
        current_speller_.reset(new Speller(errmodel->second, acceptor->second));
    }
    else if (!errmodels.empty())
    {
        fprintf(stderr, "Could not find default speller, using %s %s\n",
                acceptors.begin()->first.c_str(),
                errmodels.begin()->first.c_str());
        current_speller_.reset(new Speller(errmodels.begin()->second,
                                           acceptors.begin()->second));
    }
    else if (acceptor != acceptors.end())
    {
        current_speller_.reset(new Speller(HfstTransducerPtr(),
                                           acceptor->second));
    }
    else
    {
        current_speller_.reset(new Speller(HfstTransducerPtr(),
                                           acceptors.begin()->second));
    }
}

void
ZHfstSpeller::read_zhfst(const string& filename)
{
    ArchiveReader reader;
    archive* ar = reader.get();
    if (archive_read_open_filename(ar, filename.c_str(), 10240) != ARCHIVE_OK)
    {
        throw ZHfstZipReadingError("Could not open archive " + filename + ": " +
                                   error_of(ar));
    }
    TransducerMap acceptors;
    TransducerMap errmodels;
    ZHfstSpellerXmlMetadata metadata;
    archive_entry* entry = NULL;
    for (int rr = archive_read_next_header(ar, &entry);
         rr != ARCHIVE_EOF;
         rr = archive_read_next_header(ar, &entry))
    {
        if (rr != ARCHIVE_OK && rr != ARCHIVE_WARN)
        {
            throw ZHfstZipReadingError(string("Archive not OK: ") +
                                       error_of(ar));
        }
        string entry_name = archive_entry_pathname(entry);
        if (starts_with(entry_name, "acceptor."))
        {
            acceptors[descr_of(entry_name, "acceptor.")] =
                transducer_to_mem(ar, entry);
        }
        else if (starts_with(entry_name, "errmodel."))
        {
            errmodels[descr_of(entry_name, "errmodel.")] =
                transducer_to_mem(ar, entry);
        }
        else if (entry_name == "index.xml")
        {
            string full_data = extract_to_mem(ar, entry);
            metadata.read_xml(full_data.data(), full_data.size());
        }
        else
        {
            fprintf(stderr, "Unknown file in archive %s\n", entry_name.c_str());
        }
    }
    select_speller(acceptors, errmodels);
    metadata_ = metadata;
}

const ZHfstSpellerXmlMetadata&
ZHfstSpeller::get_metadata() const
{
    return metadata_;
}

string
ZHfstSpeller::metadata_dump() const
{
    return metadata_.debug_dump();
}

} // namespace olspell
