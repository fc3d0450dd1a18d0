/*
 * logview: Streaming log ingestion for the log viewer
 * Copyright (C) 2026  The logview authors
 *
 * This file is part of logview.
 *
 * logview is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * logview is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with logview.  If not, see <http://www.gnu.org/licenses/>.
 */

// Header guard
#pragma once
#ifndef LOGVIEW_DEREF_PROXY_H
#define LOGVIEW_DEREF_PROXY_H


// Utility
#include <utility>

namespace logview {
// Result of post-increment on single-pass iterators (dir_iter, line_iter):
// keeps a copy of the element the iterator pointed to before advancing.
template<typename T>
class deref_proxy {
private:
    T value;

public:
    explicit deref_proxy(T value) : value(std::move(value)) {}
    const T& operator*() const noexcept { return this->value; }
    const T* operator->() const noexcept { return &this->value; }
};
}  // namespace logview


#endif  // LOGVIEW_DEREF_PROXY_H
