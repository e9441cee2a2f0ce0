/** \file    Random.h
 *  \brief   Random variable related utility functions.
 */

/*
 *  Copyright 2004-2009 Project iVia.
 *  Copyright 2004-2009 The Regents of The University of California.
 *  Copyright 2017-2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as published
 *  by the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software
 *  Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */
#pragma once


#include <utility>
#include <vector>
#include <cstdlib>


namespace Random {


/** \brief Seeds the process-wide generator from the clock, unless that already happened. */
void SeedOnce();


class Uniform {
    double min_;
    double max_;
public:
    /** \brief  Constructs an object representing a pseudo-random uniform distribution over the interval
     *          [min, max).
     *  \param  min   The lower end of the distribution.
     *  \param  max   The upper end of the distribution.
     */
    explicit Uniform(const double min = 0.0, const double max = 1.0): min_(min), max_(max) { SeedOnce(); }

    /** Returns a pseudo-random deviate uniformly distributed over the interval [min, max). */
    double operator()() const { return min_ + (max_ - min_) * (::random() / (static_cast<double>(RAND_MAX) + 1.0)); }

    Uniform(const Uniform &rhs) = delete;
    const Uniform &operator=(const Uniform &rhs) = delete;
};


/** \return A pseudo-random integer in the interval [0, n). */
size_t Below(const size_t n);


/** \brief Randomly permutes "elements" (Fisher-Yates). */
template <typename Element> void Shuffle(std::vector<Element> * const elements) {
    if (elements->size() < 2)
        return;

    for (size_t i(elements->size() - 1); i > 0; --i)
        std::swap((*elements)[i], (*elements)[Below(i + 1)]);
}


} // namespace Random
