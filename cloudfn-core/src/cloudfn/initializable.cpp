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
#include "cloudfn/initializable.hpp"

#include <iostream>
#include <typeinfo>

namespace cloudfn {
UninitializeGuard::~UninitializeGuard() {
  if (!target_->is_initialized()) {
    return;
  }
  if (policy_ != kSilent) {
    std::cerr << "WARN: UninitializeGuard has found that " << typeid(*target_).name()
      << "#uninitialize() was not called when it was destructed. This is a BUG!" << std::endl;
  }
  // Note that this is AFTER uninitialize() of possibly DebuggingSupports, so no glog here.
  ErrorStack error = target_->uninitialize();
  if (error.is_error() && policy_ != kSilent) {
    std::cerr << "WARN: UninitializeGuard encounters an error on uninitialize()."
      << " We can't propagate this error appropriately. error=" << error << std::endl;
  }
}
}  // namespace cloudfn
