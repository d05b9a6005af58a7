/* -*- Mode: C++ -*- */
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

//! @mainpage API to olspell WFST spell-checking
//!
//! The olspell API has several layers for different end-users. A suggested
//! starting point for new user is the @c ZHfstSpeller object, which reads an
//! automaton set from zipped hfst file with metadata and provides high level
//! access to it with generic spell-checking, correction and analysis functions.
//! Second level of access is the Speller object, which can be used to
//! construct spell-checker with two automata and query it from any number of
//! threads, see also SpellerPool. The Speller is constructed with two
//! HfstTransducer objects which are the low-level access point to the
//! automata with all the details of transition tables and symbol
//! translations, headers and such.

#ifndef OLSPELL_ZHFSTSPELLER_H_
#define OLSPELL_ZHFSTSPELLER_H_ 1

#include "olspell-stdafx.h"

#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "buffer.h"
#include "ospell.h"
#include "ZHfstSpellerXmlMetadata.h"

namespace olspell
{
    typedef std::pair<std::string, std::string> StringPair;
    //! @brief a correction, one of its analyses and the analysis weight
    typedef std::pair<StringPair, Weight> StringPairWeightPair;
    typedef std::vector<StringPairWeightPair> AnalysisCorrectionVector;

    //! @brief ZHfstSpeller class holds one speller contained in one
    //!        zhfst file.
    //!
    //! A session owns its automata; nothing is shared between sessions.
    class OLSPELL_API ZHfstSpeller
    {
    public:
        //! @brief create speller with default values for undefined
        //!        language.
        ZHfstSpeller();

        //! @brief set upper limit for the number of suggestions
        void set_queue_limit(unsigned long limit);
        //! @brief set upper limit for weights
        void set_weight_limit(Weight limit);
        //! @brief set search beam
        void set_beam(Weight beam);
        //! @brief set time cutoff for correcting, in seconds
        void set_time_cutoff(double time_cutoff);
        //! @brief whether case variants of words are tried
        void set_case_handling(bool case_handling);
        //! @brief bound on steps in a row that consume no input
        void set_max_epsilon_steps(unsigned int steps);
        const SpellerConfig& get_config() const;

        //! @brief construct speller from named file containing valid
        //!        zhfst archive.
        void read_zhfst(const std::string& filename);
        //! @brief construct speller from a lexicon and an optional error
        //!        model, bypassing the archive.
        void read_transducers(ByteBufferPtr lexicon, ByteBufferPtr errmodel);

        //! @brief  check if the given word is spelled correctly
        bool spell(const std::string& wordform) const;
        //! @brief ordered corrections for misspelled word form.
        StringWeightVector suggest(const std::string& wordform) const;
        //! @brief corrections with their own count limit and beam
        StringWeightVector suggest(const std::string& wordform,
                                   unsigned long max_count,
                                   Weight beam) const;
        //! @brief analyse word form morphologically
        //! @param wordform   the string to analyse
        //! @param ask_sugger whether to use the spelling correction model
        //                    instead of the detection model
        StringWeightVector analyse(const std::string& wordform,
                                   bool ask_sugger = false) const;
        //! @brief construct an ordered set of corrections with analyses
        AnalysisCorrectionVector suggest_analyses(const std::string& wordform) const;

        bool can_spell() const;
        bool can_correct() const;
        //! @brief the loaded speller, to be shared with worker threads
        std::shared_ptr<const Speller> get_speller() const;

        //! @brief get access to metadata read from XML.
        const ZHfstSpellerXmlMetadata& get_metadata() const;
        //! @brief create string representation of the speller for
        //!        programmer to debug
        std::string metadata_dump() const;

    private:
        ZHfstSpeller(const ZHfstSpeller&);
        ZHfstSpeller& operator=(const ZHfstSpeller&);

        //
        // pick the default acceptor and error model out of those loaded
        void select_speller(const std::map<std::string, HfstTransducerPtr>& acceptors,
                            const std::map<std::string, HfstTransducerPtr>& errmodels);

        //! @brief limits and switches for all queries
        SpellerConfig config_;
        //! @brief current speller, also used for correcting and analysing
        std::shared_ptr<const Speller> current_speller_;
        //! @brief the metadata of loaded speller
        ZHfstSpellerXmlMetadata metadata_;
    };

    //! @brief Top-level exception for zhfst handling.

    //! Contains a human-readable error message that can be displayed to
    //! end-user as additional info when either solving exception or exiting.
    class ZHfstException : public std::runtime_error
    {
    public:
        ZHfstException() : std::runtime_error("unknown") {}
        explicit ZHfstException(const std::string& message) :
            std::runtime_error(message) {}
    };

    //! @brief Generic error in metadata parsing.
    //
    //! Gets raised if metadata is erroneous or missing.
    class ZHfstMetaDataParsingError : public ZHfstException
    {
    public:
        explicit ZHfstMetaDataParsingError(const std::string& message) :
            ZHfstException(message) {}
    };

    //! @brief Exception for XML parser errors.
    //
    //! Gets raised if underlying XML parser finds an error in XML data.
    //! Errors include non-valid XML, missing or erroneous attributes or
    //! elements, etc.
    class ZHfstXmlParsingError : public ZHfstException
    {
    public:
        explicit ZHfstXmlParsingError(const std::string& message) :
            ZHfstException(message) {}
    };

    //! @brief Generic error while reading zip file.
    //!
    //! Happens when libarchive is unable to proceed reading zip file or
    //! zip file is missing required files.
    class ZHfstZipReadingError : public ZHfstException
    {
    public:
        explicit ZHfstZipReadingError(const std::string& message) :
            ZHfstException(message) {}
    };

} // namespace olspell

#endif // OLSPELL_ZHFSTSPELLER_H_
