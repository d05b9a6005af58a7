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

#include "ZHfstSpellerXmlMetadata.h"

#include <cstdio>
#include <cstring>
#include <string>

#include "ZHfstSpeller.h"

using std::string;

namespace olspell
{

namespace {

// ids look like acceptor.default.hfst; the descr is the middle part
bool
descr_from_id(const char* id, string& descr)
{
    const char* p = strchr(id, '.');
    if (p == NULL)
    {
        return false;
    }
    const char* q = strchr(p + 1, '.');
    if (q == NULL)
    {
        return false;
    }
    descr.assign(p + 1, q);
    return true;
}

string
required_text(const tinyxml2::XMLElement& node)
{
    const char* text = node.GetText();
    if (text == NULL)
    {
        throw ZHfstXmlParsingError(string("<") + node.Name() +
                                   "> must be non-empty");
    }
    return text;
}

string
optional_text(const tinyxml2::XMLElement& node)
{
    const char* text = node.GetText();
    return text == NULL ? string() : string(text);
}

void
append_versions(string& out, const string& label,
                const LanguageVersions& versions)
{
    for (LanguageVersions::const_iterator it = versions.begin();
         it != versions.end(); ++it)
    {
        out.append(label + " [" + it->first + "]: " + it->second + "\n");
    }
}

} // anonymous namespace

ZHfstSpellerXmlMetadata::ZHfstSpellerXmlMetadata()
{
    info_.locale_ = "und";
}

void
ZHfstSpellerXmlMetadata::parse_xml(const tinyxml2::XMLDocument& doc)
{
    const tinyxml2::XMLElement* rootNode = doc.RootElement();
    if (NULL == rootNode)
    {
        throw ZHfstMetaDataParsingError("No root node in index XML");
    }
    if (strcmp(rootNode->Name(), "hfstspeller") != 0)
    {
        throw ZHfstMetaDataParsingError("could not find <hfstspeller> "
                                        "root from XML file");
    }
    verify_hfstspeller(*rootNode);
    for (const tinyxml2::XMLElement* child = rootNode->FirstChildElement();
         child != NULL; child = child->NextSiblingElement())
    {
        if (strcmp(child->Name(), "info") == 0)
        {
            parse_info(*child);
        }
        else if (strcmp(child->Name(), "acceptor") == 0)
        {
            parse_acceptor(*child);
        }
        else if (strcmp(child->Name(), "errmodel") == 0)
        {
            parse_errmodel(*child);
        }
        else
        {
            fprintf(stderr, "DEBUG: Unknown root child %s\n", child->Name());
        }
    }
}

void
ZHfstSpellerXmlMetadata::verify_hfstspeller(const tinyxml2::XMLElement& hfstspellerNode)
{
    if (!hfstspellerNode.Attribute("hfstversion"))
    {
        throw ZHfstMetaDataParsingError("No hfstversion attribute in root");
    }
    if (!hfstspellerNode.Attribute("hfstversion", "3"))
    {
        throw ZHfstMetaDataParsingError("Unrecognised HFST version...");
    }
    if (!hfstspellerNode.Attribute("dtdversion"))
    {
        throw ZHfstMetaDataParsingError("No dtdversion attribute in root");
    }
    if (!hfstspellerNode.Attribute("dtdversion", "1.0"))
    {
        throw ZHfstMetaDataParsingError("Unrecognised DTD version...");
    }
}

void
ZHfstSpellerXmlMetadata::parse_info(const tinyxml2::XMLElement& infoNode)
{
    for (const tinyxml2::XMLElement* info = infoNode.FirstChildElement();
         info != NULL; info = info->NextSiblingElement())
    {
        if (strcmp(info->Name(), "locale") == 0)
        {
            parse_locale(*info);
        }
        else if (strcmp(info->Name(), "title") == 0)
        {
            parse_translation(*info, info_.title_);
        }
        else if (strcmp(info->Name(), "description") == 0)
        {
            parse_translation(*info, info_.description_);
        }
        else if (strcmp(info->Name(), "version") == 0)
        {
            parse_version(*info);
        }
        else if (strcmp(info->Name(), "date") == 0)
        {
            info_.date_ = optional_text(*info);
        }
        else if (strcmp(info->Name(), "producer") == 0)
        {
            info_.producer_ = optional_text(*info);
        }
        else if (strcmp(info->Name(), "contact") == 0)
        {
            parse_contact(*info);
        }
        else
        {
            fprintf(stderr, "DEBUG: unknown info child %s\n", info->Name());
        }
    }
}

void
ZHfstSpellerXmlMetadata::parse_locale(const tinyxml2::XMLElement& localeNode)
{
    string locale = required_text(localeNode);
    if ((info_.locale_ != "und") && (info_.locale_ != locale))
    {
        // the later definition wins
        fprintf(stderr, "Warning: mismatched languages in "
                "file data (%s) and XML (%s)\n",
                info_.locale_.c_str(), locale.c_str());
    }
    info_.locale_ = locale;
}

void
ZHfstSpellerXmlMetadata::parse_translation(const tinyxml2::XMLElement& node,
                                           LanguageVersions& versions)
{
    string text = required_text(node);
    const char* lang = node.Attribute("lang");
    versions[lang != NULL ? string(lang) : info_.locale_] = text;
}

void
ZHfstSpellerXmlMetadata::parse_version(const tinyxml2::XMLElement& versionNode)
{
    if (versionNode.Attribute("vcsrev"))
    {
        info_.vcsrev_ = versionNode.Attribute("vcsrev");
    }
    info_.version_ = optional_text(versionNode);
}

void
ZHfstSpellerXmlMetadata::parse_contact(const tinyxml2::XMLElement& contactNode)
{
    if (contactNode.Attribute("email"))
    {
        info_.email_ = contactNode.Attribute("email");
    }
    if (contactNode.Attribute("website"))
    {
        info_.website_ = contactNode.Attribute("website");
    }
}

void
ZHfstSpellerXmlMetadata::parse_acceptor(const tinyxml2::XMLElement& acceptorNode)
{
    const char* xid = acceptorNode.Attribute("id");
    if (xid == NULL)
    {
        throw ZHfstMetaDataParsingError("id missing in acceptor");
    }
    string descr;
    if (!descr_from_id(xid, descr))
    {
        throw ZHfstMetaDataParsingError(string("Invalid id in acceptor: ") + xid);
    }
    ZHfstSpellerAcceptorMetadata& acceptor = acceptor_[descr];
    acceptor.descr_ = descr;
    acceptor.id_ = xid;
    if (acceptorNode.Attribute("trtype"))
    {
        acceptor.transtype_ = acceptorNode.Attribute("trtype");
    }
    if (acceptorNode.Attribute("type"))
    {
        acceptor.type_ = acceptorNode.Attribute("type");
    }
    for (const tinyxml2::XMLElement* acc = acceptorNode.FirstChildElement();
         acc != NULL; acc = acc->NextSiblingElement())
    {
        if (strcmp(acc->Name(), "title") == 0)
        {
            parse_translation(*acc, acceptor.title_);
        }
        else if (strcmp(acc->Name(), "description") == 0)
        {
            parse_translation(*acc, acceptor.description_);
        }
        else
        {
            fprintf(stderr, "DEBUG: unknown acceptor child %s\n", acc->Name());
        }
    }
}

void
ZHfstSpellerXmlMetadata::parse_errmodel(const tinyxml2::XMLElement& errmodelNode)
{
    const char* xid = errmodelNode.Attribute("id");
    if (xid == NULL)
    {
        throw ZHfstMetaDataParsingError("id missing in errmodel");
    }
    ZHfstSpellerErrModelMetadata errmodel;
    if (!descr_from_id(xid, errmodel.descr_))
    {
        throw ZHfstMetaDataParsingError(string("Invalid id in errmodel: ") + xid);
    }
    errmodel.id_ = xid;
    for (const tinyxml2::XMLElement* errm = errmodelNode.FirstChildElement();
         errm != NULL; errm = errm->NextSiblingElement())
    {
        if (strcmp(errm->Name(), "title") == 0)
        {
            parse_translation(*errm, errmodel.title_);
        }
        else if (strcmp(errm->Name(), "description") == 0)
        {
            parse_translation(*errm, errmodel.description_);
        }
        else if (strcmp(errm->Name(), "type") == 0)
        {
            const char* type = errm->Attribute("type");
            if (type == NULL)
            {
                throw ZHfstMetaDataParsingError("No type in type");
            }
            errmodel.type_.push_back(type);
        }
        else if (strcmp(errm->Name(), "model") == 0)
        {
            errmodel.model_.push_back(optional_text(*errm));
        }
        else
        {
            fprintf(stderr, "DEBUG: unknown errmodel child %s\n", errm->Name());
        }
    }
    errmodel_.push_back(errmodel);
}

void
ZHfstSpellerXmlMetadata::read_xml(const char* xml_data, size_t xml_len)
{
    tinyxml2::XMLDocument doc;
    if (doc.Parse(xml_data, xml_len) != tinyxml2::XML_SUCCESS)
    {
        throw ZHfstXmlParsingError(string("Reading XML from memory: ") +
                                   doc.ErrorName());
    }
    parse_xml(doc);
}

void
ZHfstSpellerXmlMetadata::read_xml(const string& filename)
{
    tinyxml2::XMLDocument doc;
    if (doc.LoadFile(filename.c_str()) != tinyxml2::XML_SUCCESS)
    {
        throw ZHfstXmlParsingError("Reading XML from file " + filename +
                                   ": " + doc.ErrorName());
    }
    parse_xml(doc);
}

string
ZHfstSpellerXmlMetadata::debug_dump() const
{
    string retval = "locale: " + info_.locale_ + "\n"
        "version: " + info_.version_ + " [vcsrev: " + info_.vcsrev_ + "]\n"
        "date: " + info_.date_ + "\n"
        "producer: " + info_.producer_ + " [email: <" + info_.email_ + ">, "
        "website: <" + info_.website_ + ">]\n";
    append_versions(retval, "title", info_.title_);
    append_versions(retval, "description", info_.description_);
    for (std::map<string, ZHfstSpellerAcceptorMetadata>::const_iterator acc =
             acceptor_.begin(); acc != acceptor_.end(); ++acc)
    {
        retval.append("acceptor[" + acc->second.descr_ + "] [id: " +
                      acc->second.id_ + ", type: " + acc->second.type_ +
                      ", trtype: " + acc->second.transtype_ + "]\n");
        append_versions(retval, "title", acc->second.title_);
        append_versions(retval, "description", acc->second.description_);
    }
    for (std::vector<ZHfstSpellerErrModelMetadata>::const_iterator errm =
             errmodel_.begin(); errm != errmodel_.end(); ++errm)
    {
        retval.append("errmodel[" + errm->descr_ + "] [id: " + errm->id_ +
                      "]\n");
        append_versions(retval, "title", errm->title_);
        append_versions(retval, "description", errm->description_);
        for (size_t i = 0; i < errm->type_.size(); ++i)
        {
            retval.append("type: " + errm->type_[i] + "\n");
        }
        for (size_t i = 0; i < errm->model_.size(); ++i)
        {
            retval.append("model: " + errm->model_[i] + "\n");
        }
    }
    return retval;
}

} // namespace olspell
