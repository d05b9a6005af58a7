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

#ifndef OLSPELL_ZHFSTSPELLERXMLMETADATA_H_
#define OLSPELL_ZHFSTSPELLERXMLMETADATA_H_ 1

#include "olspell-stdafx.h"

#include <map>
#include <string>
#include <vector>

#include <tinyxml2.h>

namespace olspell
{
    //! @brief data type for associating set of translations to languages.
    typedef std::map<std::string, std::string> LanguageVersions;

    //! @brief the info block of an index.xml
    struct ZHfstSpellerInfoMetadata
    {
        //! @brief active locale of speller in BCP format
        std::string locale_;
        LanguageVersions title_;
        LanguageVersions description_;
        //! @brief version definition as free form string
        std::string version_;
        std::string vcsrev_;
        std::string date_;
        std::string producer_;
        std::string email_;
        std::string website_;
    };

    //! @brief one acceptor block of an index.xml
    struct ZHfstSpellerAcceptorMetadata
    {
        //! @brief full id, e.g. acceptor.default.hfst
        std::string id_;
        //! @brief descr part of the id
        std::string descr_;
        //! @brief type of dictionary
        std::string type_;
        //! @brief type of transducer
        std::string transtype_;
        LanguageVersions title_;
        LanguageVersions description_;
    };

    //! @brief one errmodel block of an index.xml
    struct ZHfstSpellerErrModelMetadata
    {
        std::string id_;
        std::string descr_;
        LanguageVersions title_;
        LanguageVersions description_;
        std::vector<std::string> type_;
        std::vector<std::string> model_;
    };

    //! @brief holds the index.xml metadata of one archive
    class OLSPELL_API ZHfstSpellerXmlMetadata
    {
    public:
        //! @brief construct metadata for undefined language
        ZHfstSpellerXmlMetadata();
        //! @brief read metadata from XML file by @a filename.
        void read_xml(const std::string& filename);
        //! @brief read XML from @a data of @a data_length bytes
        void read_xml(const char* data, size_t data_length);
        //! @brief create a programmer readable dump of XML metadata.
        std::string debug_dump() const;

        ZHfstSpellerInfoMetadata info_; //!< The info node data
        //! @brief acceptors by descr
        std::map<std::string, ZHfstSpellerAcceptorMetadata> acceptor_;
        //! @brief error models in document order
        std::vector<ZHfstSpellerErrModelMetadata> errmodel_;

    private:
        void parse_xml(const tinyxml2::XMLDocument& doc);
        void verify_hfstspeller(const tinyxml2::XMLElement& hfstspellerNode);
        void parse_info(const tinyxml2::XMLElement& infoNode);
        void parse_locale(const tinyxml2::XMLElement& localeNode);
        void parse_version(const tinyxml2::XMLElement& versionNode);
        void parse_contact(const tinyxml2::XMLElement& contactNode);
        void parse_acceptor(const tinyxml2::XMLElement& acceptorNode);
        void parse_errmodel(const tinyxml2::XMLElement& errmodelNode);
        //
        // store a title or description under its lang, or the locale
        void parse_translation(const tinyxml2::XMLElement& node,
                               LanguageVersions& versions);
    };
}

#endif // OLSPELL_ZHFSTSPELLERXMLMETADATA_H_
