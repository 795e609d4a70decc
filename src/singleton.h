/* Copyright (C) 2017-2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef SINGLETON_H
#define SINGLETON_H

// Process wide instance, created on first use. T must be default
// constructible and stays alive until exit.
template <typename T>
class Singleton {
   public:
    static T* instance() {
        static T inst;
        return &inst;
    }

    Singleton(const Singleton&) = delete;
    Singleton& operator=(const Singleton&) = delete;

   protected:
    Singleton() = default;
    ~Singleton() = default;
};

#endif  // SINGLETON_H
