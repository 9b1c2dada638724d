/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 1/20/18.
//

#pragma once

#include <iosfwd>
#include <ostream>

namespace imagio {

template <typename T>
class BasicSize
{
public:
	constexpr BasicSize() = default;
	constexpr BasicSize(T width, T height) : m_width{width}, m_height{height} {}

	[[nodiscard]] constexpr T width() const {return m_width;}
	[[nodiscard]] constexpr T height() const {return m_height;}

	void width(T w) {m_width = w;}
	void height(T h) {m_height = h;}
	void assign(T w, T h) {m_width = w; m_height = h;}

	[[nodiscard]] constexpr bool empty() const {return m_width <= 0 || m_height <= 0;}

	bool operator==(const BasicSize& other) const = default;

private:
	T m_width{};
	T m_height{};
};

using Size2D = BasicSize<int>;

template <typename T>
std::ostream& operator<<(std::ostream& os, const BasicSize<T>& size)
{
	return os << size.width() << 'x' << size.height();
}

} // end of namespace imagio
