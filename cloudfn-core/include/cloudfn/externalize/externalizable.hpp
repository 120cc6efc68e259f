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
#ifndef CLOUDFN_EXTERNALIZE_EXTERNALIZABLE_HPP_
#define CLOUDFN_EXTERNALIZE_EXTERNALIZABLE_HPP_
#include <stdint.h>

#include <iosfwd>
#include <string>
#include <vector>

#include "cloudfn/cxx11.hpp"
#include "cloudfn/error_stack.hpp"
#include "cloudfn/fs/fwd.hpp"

// forward declarations for tinyxml2. They should provide a header file for this...
namespace tinyxml2 {
  class XMLDocument;
  class XMLElement;
}  // namespace tinyxml2

namespace cloudfn {
namespace externalize {
/**
 * @brief Represents an object that can be written to and read from files/bytes in XML format.
 * @ingroup EXTERNALIZE
 * @details
 * Derived classes must implement load() and save(), usually via the EXTERNALIZABLE macro plus
 * EXTERNALIZE_LOAD_ELEMENT/EXTERNALIZE_SAVE_ELEMENT for each member.
 * All option groups of CloudfnOptions, task records and schedule definitions are externalizable.
 *
 * @par Why XML
 * Human-readable, comments can be embedded next to each value, and tinyxml2 is tiny.
 */
struct Externalizable {
  virtual ~Externalizable() {}

  /**
   * @brief Reads the content of this object from the given XML element.
   * @details
   * Expect errors due to missing-elements, out-of-range values, etc.
   */
  virtual ErrorStack load(tinyxml2::XMLElement* element) = 0;

  /**
   * @brief Writes the content of this object to the given XML element.
   * @details
   * The parent object determines children's tag names, so this method does not determine
   * the XML element name of itself.
   */
  virtual ErrorStack save(tinyxml2::XMLElement* element) const = 0;

  /** Returns an XML tag name for this object as a root element. */
  virtual const char* get_tag_name() const = 0;

  /** Polymorphic assign operator. This should invoke operator= of the derived class. */
  virtual void assign(const cloudfn::externalize::Externalizable *other) = 0;

  /** Invokes save() and directs the resulting XML text to the given stream. */
  void        save_to_stream(std::ostream* ptr) const;

  /** Load the content of this object from the specified XML file. */
  ErrorStack  load_from_file(const fs::Path &path);

  /**
   * @brief Atomically and durably writes out this object to the specified XML file.
   * @details
   * If the file exists, this method atomically overwrites it via POSIX's atomic rename semantics.
   * If the parent folder doesn't exist, this method automatically creates the folder.
   */
  ErrorStack  save_to_file(const fs::Path &path) const;

  // convenience methods
  static ErrorStack insert_comment(tinyxml2::XMLElement* element, const std::string& comment);
  static ErrorStack append_comment(tinyxml2::XMLElement* parent, const std::string& comment);
  static ErrorStack create_element(tinyxml2::XMLElement* parent, const std::string& name,
                  tinyxml2::XMLElement** out);

  /**
   * Only declaration in header. Explicitly instantiated in cpp for each type this func handles.
   */
  template <typename T>
  static ErrorStack add_element(tinyxml2::XMLElement* parent, const std::string& tag,
                  const std::string& comment, T value);

  /** enum version */
  template <typename ENUM>
  static ErrorStack add_enum_element(tinyxml2::XMLElement* parent, const std::string& tag,
                const std::string& comment, ENUM value) {
    return add_element(parent, tag, comment, static_cast<int64_t>(value));
  }

  /** child Externalizable version */
  static ErrorStack add_child_element(tinyxml2::XMLElement* parent, const std::string& tag,
                  const std::string& comment, const Externalizable& child);

  /**
   * Only declaration in header. Explicitly instantiated in cpp for each type this func handles.
   */
  template <typename T>
  static ErrorStack get_element(tinyxml2::XMLElement* parent, const std::string& tag,
                  T* out, bool optional = false, T value = 0);
  /** string type is bit special. */
  static ErrorStack get_element(tinyxml2::XMLElement* parent, const std::string& tag,
                  std::string* out, bool optional = false, const char* value = "");

  /** enum version */
  template <typename ENUM>
  static ErrorStack get_enum_element(tinyxml2::XMLElement* parent, const std::string& tag,
          ENUM* out, bool optional = false, ENUM default_value = static_cast<ENUM>(0)) {
    int64_t tmp;
    CHECK_ERROR(get_element<int64_t>(parent, tag, &tmp, optional, default_value));
    if (static_cast<int64_t>(static_cast<ENUM>(tmp)) != tmp) {
      return ERROR_STACK_MSG(kErrorCodeConfValueOutofrange, tag.c_str());
    }
    *out = static_cast<ENUM>(tmp);
    return kRetOk;
  }

  /** child Externalizable version */
  static ErrorStack get_child_element(tinyxml2::XMLElement* parent, const std::string& tag,
            Externalizable* child, bool optional = false);
};

}  // namespace externalize
}  // namespace cloudfn

// A bit tricky to get "a" from a in C macro.
#define EX_QUOTE(str) #str
#define EX_EXPAND(str) EX_QUOTE(str)

/**
 * @def EXTERNALIZE_SAVE_ELEMENT(element, attribute, comment)
 * @ingroup EXTERNALIZE
 * @brief Adds an xml element to represent a member variable of this object.
 * The tag name is the name of the member variable.
 */
#define EXTERNALIZE_SAVE_ELEMENT(element, attribute, comment) \
  CHECK_ERROR(add_element(element, EX_EXPAND(attribute), comment, attribute))
/**
 * @def EXTERNALIZE_SAVE_ENUM_ELEMENT(element, attribute, comment)
 * @ingroup EXTERNALIZE
 * @brief Adds an xml element to represent a member variable of this object, for enums.
 */
#define EXTERNALIZE_SAVE_ENUM_ELEMENT(element, attribute, comment) \
  CHECK_ERROR(add_enum_element(element, EX_EXPAND(attribute), comment, attribute))

/**
 * @def EXTERNALIZE_LOAD_ELEMENT(element, attribute)
 * @ingroup EXTERNALIZE
 * @brief Reads a child xml element to load a member variable of this object.
 */
#define EXTERNALIZE_LOAD_ELEMENT(element, attribute) \
  CHECK_ERROR(get_element(element, EX_EXPAND(attribute), & attribute))
/**
 * @def EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, attribute, default_value)
 * @ingroup EXTERNALIZE
 * @brief Reads a child xml element to load a member variable of this object.
 * If the xml element doesn't exist, set the default value.
 */
#define EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, attribute, default_value) \
  CHECK_ERROR(get_element(element, EX_EXPAND(attribute), & attribute, true, default_value))

/**
 * @def EXTERNALIZE_LOAD_ENUM_ELEMENT(element, attribute)
 * @ingroup EXTERNALIZE
 * @brief Reads a child xml element to load an enum member variable of this object.
 */
#define EXTERNALIZE_LOAD_ENUM_ELEMENT(element, attribute) \
  CHECK_ERROR(get_enum_element(element, EX_EXPAND(attribute), & attribute))

/**
 * @def EXTERNALIZABLE(clazz)
 * @ingroup EXTERNALIZE
 * @brief Macro to declare/define essential methods for an externalizable class.
 */
#define EXTERNALIZABLE(clazz) \
  ErrorStack load(tinyxml2::XMLElement* element) CXX11_OVERRIDE;\
  ErrorStack save(tinyxml2::XMLElement* element) const CXX11_OVERRIDE;\
  const char* get_tag_name() const CXX11_OVERRIDE { return EX_EXPAND(clazz); }\
  void assign(const cloudfn::externalize::Externalizable *other) CXX11_OVERRIDE {\
    *this = *dynamic_cast< const clazz * >(other);\
  }\
  friend std::ostream& operator<<(std::ostream& o, const clazz & v) {\
    v.save_to_stream(&o);\
    return o;\
  }

#endif  // CLOUDFN_EXTERNALIZE_EXTERNALIZABLE_HPP_
