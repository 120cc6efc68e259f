/*
 * Copyright (c) 2014-2015, Hewlett-Packard Development Company, LP.
 * This program is free software; you can redistribute it and/or modify it
 * under the terms of the GNU General Public License as published by the Free
 * Software Foundation; either version 2 of the License, or (at your option)
 * any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT
 * ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 * FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for
 * more details. You should have received a copy of the GNU General Public
 * License along with this program; if not, write to the Free Software
 * Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA 02111-1307 USA
 *
 * HP designates this particular file as subject to the "Classpath" exception
 * as provided by HP in the LICENSE.txt file that accompanied this code.
 */
#include "cloudfn/externalize/externalizable.hpp"

#include <tinyxml2.h>

#include <ostream>
#include <sstream>
#include <string>

#include "cloudfn/assorted/assorted_func.hpp"
#include "cloudfn/externalize/tinyxml_wrapper.hpp"
#include "cloudfn/fs/filesystem.hpp"
#include "cloudfn/fs/path.hpp"

namespace cloudfn {
namespace externalize {

/** Type names shown in the comments of saved XML files. */
template <typename T> struct TypeLabel { static const char* name(); };
template <> const char* TypeLabel<bool>::name() { return "bool"; }
template <> const char* TypeLabel<int32_t>::name() { return "int32_t"; }
template <> const char* TypeLabel<int64_t>::name() { return "int64_t"; }
template <> const char* TypeLabel<uint16_t>::name() { return "uint16_t"; }
template <> const char* TypeLabel<uint32_t>::name() { return "uint32_t"; }
template <> const char* TypeLabel<uint64_t>::name() { return "uint64_t"; }
template <> const char* TypeLabel<std::string>::name() { return "string"; }

#define INSTANTIATE_ALL_TYPES(M) M(bool); M(int32_t); M(int64_t); M(uint16_t); M(uint32_t);\
  M(uint64_t); M(std::string)

void Externalizable::save_to_stream(std::ostream* ptr) const {
  std::ostream &o = *ptr;
  tinyxml2::XMLDocument doc;
  // root element name is class name.
  tinyxml2::XMLElement* element = doc.NewElement(get_tag_name());
  if (!element) {
    o << "Out-of-memory during Externalizable::save_to_stream()";
    return;
  }
  doc.InsertFirstChild(element);
  ErrorStack error_stack = save(element);
  if (error_stack.is_error()) {
    o << "Failed during Externalizable::save_to_stream(): " << error_stack;
    return;
  }
  tinyxml2::XMLPrinter printer;
  doc.Print(&printer);
  o << printer.CStr();
}

ErrorStack Externalizable::load_from_file(const fs::Path& path) {
  if (!fs::exists(path)) {
    return ERROR_STACK_MSG(kErrorCodeConfFileNotFound, path.c_str());
  }
  std::string content;
  if (!fs::read_file(path, &content)) {
    std::stringstream custom_message;
    custom_message << "file=" << path << ", err=" << assorted::os_error();
    return ERROR_STACK_MSG(kErrorCodeFsReadFail, custom_message.str().c_str());
  }

  tinyxml2::XMLDocument document;
  if (document.Parse(content.data(), content.size()) != tinyxml2::XML_SUCCESS) {
    // Truncated task records and hand-edited configs both end up here.
    std::stringstream custom_message;
    custom_message << "file=" << path << ", tinyxml2 error=" << document.ErrorID();
    return ERROR_STACK_MSG(kErrorCodeConfParseFailed, custom_message.str().c_str());
  }
  tinyxml2::XMLElement* root = document.RootElement();
  if (root == CXX11_NULLPTR) {
    return ERROR_STACK_MSG(kErrorCodeConfEmptyXml, path.c_str());
  }
  return load(root);
}

ErrorStack Externalizable::save_to_file(const fs::Path& path) const {
  // construct the XML in memory
  tinyxml2::XMLDocument document;
  tinyxml2::XMLElement* root = document.NewElement(get_tag_name());
  CHECK_OUTOFMEMORY(root);
  document.InsertFirstChild(root);
  CHECK_ERROR(save(root));

  fs::Path folder = path.parent_path();
  // create the folder if not exists
  if (!fs::exists(folder)) {
    if (!fs::create_directories(folder, true)) {
      std::stringstream custom_message;
      custom_message << "file=" << path << ", folder=" << folder
        << ", err=" << assorted::os_error();
      return ERROR_STACK_MSG(kErrorCodeFsMkdirFailed, custom_message.str().c_str());
    }
  }

  tinyxml2::XMLPrinter xml_stream;
  document.Print(&xml_stream);
  // temp file + fsync + rename, so readers never see a half-written record.
  if (!fs::durable_write_file(path, std::string(xml_stream.CStr()))) {
    std::stringstream custom_message;
    custom_message << "file=" << path << ", err=" << assorted::os_error();
    return ERROR_STACK_MSG(kErrorCodeConfCouldNotWrite, custom_message.str().c_str());
  }
  return kRetOk;
}


ErrorStack insert_comment_impl(tinyxml2::XMLElement* element, const std::string& comment) {
  if (comment.size() > 0) {
    tinyxml2::XMLComment* cm = element->GetDocument()->NewComment(comment.c_str());
    CHECK_OUTOFMEMORY(cm);
    tinyxml2::XMLNode* parent = element->Parent();
    if (!parent) {
      element->GetDocument()->InsertFirstChild(cm);
    } else {
      tinyxml2::XMLNode* previous = element->PreviousSibling();
      if (previous) {
        parent->InsertAfterChild(previous, cm);
      } else {
        parent->InsertFirstChild(cm);
      }
    }
  }
  return kRetOk;
}
ErrorStack Externalizable::insert_comment(tinyxml2::XMLElement* element,
                      const std::string& comment) {
  return insert_comment_impl(element, comment);
}
ErrorStack Externalizable::append_comment(tinyxml2::XMLElement* parent,
                      const std::string& comment) {
  if (comment.size() > 0) {
    tinyxml2::XMLComment* cm = parent->GetDocument()->NewComment(comment.c_str());
    CHECK_OUTOFMEMORY(cm);
    parent->InsertEndChild(cm);
  }
  return kRetOk;
}

ErrorStack Externalizable::create_element(tinyxml2::XMLElement* parent, const std::string& name,
        tinyxml2::XMLElement** out) {
  *out = parent->GetDocument()->NewElement(name.c_str());
  CHECK_OUTOFMEMORY(*out);
  parent->InsertEndChild(*out);
  return kRetOk;
}

template <typename T>
ErrorStack Externalizable::add_element(tinyxml2::XMLElement* parent,
                const std::string& tag, const std::string& comment, T value) {
  tinyxml2::XMLElement* element = parent->GetDocument()->NewElement(tag.c_str());
  CHECK_OUTOFMEMORY(element);
  TinyxmlSetter<T> tinyxml_setter;
  tinyxml_setter(element, value);
  parent->InsertEndChild(element);
  if (comment.size() > 0) {
    CHECK_ERROR(insert_comment_impl(element,
            tag + " (type=" + TypeLabel<T>::name() + "): " + comment));
  }
  return kRetOk;
}

// Explicit instantiations for each type
// @cond DOXYGEN_IGNORE
#define EXPLICIT_INSTANTIATION_ADD(x) template ErrorStack Externalizable::add_element< x > \
  (tinyxml2::XMLElement* parent, const std::string& tag, const std::string& comment, x value)
INSTANTIATE_ALL_TYPES(EXPLICIT_INSTANTIATION_ADD);
// @endcond

ErrorStack Externalizable::add_child_element(tinyxml2::XMLElement* parent, const std::string& tag,
                     const std::string& comment, const Externalizable& child) {
  tinyxml2::XMLElement* element = parent->GetDocument()->NewElement(tag.c_str());
  CHECK_OUTOFMEMORY(element);
  parent->InsertEndChild(element);
  CHECK_ERROR(insert_comment_impl(element, comment));
  CHECK_ERROR(child.save(element));
  return kRetOk;
}

template <typename T>
ErrorStack Externalizable::get_element(tinyxml2::XMLElement* parent, const std::string& tag,
                      T* out, bool optional, T default_value) {
  TinyxmlGetter<T> tinyxml_getter;
  tinyxml2::XMLElement* element = parent->FirstChildElement(tag.c_str());
  if (element) {
    tinyxml2::XMLError xml_error = tinyxml_getter(element, out);
    if (xml_error == tinyxml2::XML_SUCCESS) {
      return kRetOk;
    } else {
      return ERROR_STACK_MSG(kErrorCodeConfInvalidElement, tag.c_str());
    }
  } else {
    if (optional) {
      *out = default_value;
      return kRetOk;
    } else {
      return ERROR_STACK_MSG(kErrorCodeConfMissingElement, tag.c_str());
    }
  }
}

// Explicit instantiations for each type
// @cond DOXYGEN_IGNORE
#define EXPLICIT_INSTANTIATION_GET(x) template ErrorStack Externalizable::get_element< x > \
  (tinyxml2::XMLElement* parent, const std::string& tag, x * out, bool optional, x default_value)
INSTANTIATE_ALL_TYPES(EXPLICIT_INSTANTIATION_GET);
// @endcond

ErrorStack Externalizable::get_element(tinyxml2::XMLElement* parent, const std::string& tag,
                  std::string* out, bool optional, const char* default_value) {
  return get_element<std::string>(parent, tag, out, optional, std::string(default_value));
}

ErrorStack Externalizable::get_child_element(tinyxml2::XMLElement* parent, const std::string& tag,
                     Externalizable* child, bool optional) {
  tinyxml2::XMLElement* element = parent->FirstChildElement(tag.c_str());
  if (element) {
    return child->load(element);
  } else {
    if (optional) {
      return kRetOk;
    } else {
      return ERROR_STACK_MSG(kErrorCodeConfMissingElement, tag.c_str());
    }
  }
}

}  // namespace externalize
}  // namespace cloudfn
