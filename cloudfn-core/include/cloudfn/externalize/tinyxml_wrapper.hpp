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
#ifndef CLOUDFN_EXTERNALIZE_TINYXML_WRAPPER_HPP_
#define CLOUDFN_EXTERNALIZE_TINYXML_WRAPPER_HPP_

#include <stdint.h>
#include <tinyxml2.h>

#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <string>

#include "cloudfn/cxx11.hpp"

namespace cloudfn {
namespace externalize {
/**
 * @brief Functor to help use tinyxml2's Element QueryXxxText().
 * @ingroup EXTERNALIZE
 * @details
 * tinyxml2's integer getters/setters differ between its versions (64-bit ones came late),
 * so integers go through the element text and strtoll/strtoull.
 */
template <typename T> struct TinyxmlGetter {
  tinyxml2::XMLError operator()(const tinyxml2::XMLElement *element, T* out);
};
template<> struct TinyxmlGetter<bool> {
  tinyxml2::XMLError operator()(const tinyxml2::XMLElement *element, bool *out) {
    return element->QueryBoolText(out);
  }
};

template<> struct TinyxmlGetter<int64_t> {
  tinyxml2::XMLError operator()(const tinyxml2::XMLElement *element, int64_t *out) {
    const char* text = element->GetText();
    if (!text) {
      return tinyxml2::XML_NO_TEXT_NODE;
    }
    char* end = CXX11_NULLPTR;
    errno = 0;
    long long value = std::strtoll(text, &end, 10);  // NOLINT(runtime/int)
    if (errno != 0 || end == text || *end != '\0') {
      return tinyxml2::XML_CAN_NOT_CONVERT_TEXT;
    }
    *out = static_cast<int64_t>(value);
    return tinyxml2::XML_SUCCESS;
  }
};
template<> struct TinyxmlGetter<uint64_t> {
  tinyxml2::XMLError operator()(const tinyxml2::XMLElement *element, uint64_t *out) {
    const char* text = element->GetText();
    if (!text || text[0] == '-') {
      return text ? tinyxml2::XML_CAN_NOT_CONVERT_TEXT : tinyxml2::XML_NO_TEXT_NODE;
    }
    char* end = CXX11_NULLPTR;
    errno = 0;
    unsigned long long value = std::strtoull(text, &end, 10);  // NOLINT(runtime/int)
    if (errno != 0 || end == text || *end != '\0') {
      return tinyxml2::XML_CAN_NOT_CONVERT_TEXT;
    }
    *out = static_cast<uint64_t>(value);
    return tinyxml2::XML_SUCCESS;
  }
};

template <typename T, typename LARGEST_TYPE, typename LARGEST_GETTER>
tinyxml2::XMLError get_smaller_int(const tinyxml2::XMLElement *element, T* out) {
  LARGEST_TYPE tmp;
  LARGEST_GETTER largest_getter;
  tinyxml2::XMLError ret = largest_getter(element, &tmp);
  if (ret != tinyxml2::XML_SUCCESS) {
    return ret;
  }
  *out = static_cast<T>(tmp);
  if (static_cast<LARGEST_TYPE>(*out) != tmp) {
    return tinyxml2::XML_CAN_NOT_CONVERT_TEXT;
  } else {
    return tinyxml2::XML_SUCCESS;
  }
}

template<> struct TinyxmlGetter<int32_t> {
  tinyxml2::XMLError operator()(const tinyxml2::XMLElement *element, int32_t *out) {
    return get_smaller_int<int32_t, int64_t, TinyxmlGetter<int64_t> >(element, out);
  }
};
template<> struct TinyxmlGetter<uint32_t> {
  tinyxml2::XMLError operator()(const tinyxml2::XMLElement *element, uint32_t *out) {
    return get_smaller_int<uint32_t, uint64_t, TinyxmlGetter<uint64_t> >(element, out);
  }
};
template<> struct TinyxmlGetter<uint16_t> {
  tinyxml2::XMLError operator()(const tinyxml2::XMLElement *element, uint16_t *out) {
    return get_smaller_int<uint16_t, uint64_t, TinyxmlGetter<uint64_t> >(element, out);
  }
};

template<> struct TinyxmlGetter<std::string> {
  tinyxml2::XMLError operator()(const tinyxml2::XMLElement *element, std::string *out) {
    const char* text = element->GetText();
    if (text) {
      *out = text;
    } else {
      out->clear();
    }
    return tinyxml2::XML_SUCCESS;
  }
};

/**
 * @brief Functor to help use tinyxml2's Element SetText().
 * @ingroup EXTERNALIZE
 */
template <typename T> struct TinyxmlSetter {
  void operator()(tinyxml2::XMLElement *element, T value) {
    std::stringstream str;
    str << value;
    element->SetText(str.str().c_str());
  }
};
template <> struct TinyxmlSetter<bool> {
  void operator()(tinyxml2::XMLElement *element, bool value) {
    element->SetText(value ? "true" : "false");
  }
};
template <> struct TinyxmlSetter<std::string> {
  void operator()(tinyxml2::XMLElement *element, std::string value) {
    element->SetText(value.c_str());
  }
};

}  // namespace externalize
}  // namespace cloudfn

#endif  // CLOUDFN_EXTERNALIZE_TINYXML_WRAPPER_HPP_
