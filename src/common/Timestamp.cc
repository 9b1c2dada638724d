/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the imagio
	distribution for more details.
*/

//
// Created by nestal on 5/27/18.
//

#include "Timestamp.hh"

#include <nlohmann/json.hpp>

#include <ctime>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace imagio {

using namespace std::chrono;

void to_json(nlohmann::json& json, const Timestamp& input)
{
	json = input.time_since_epoch().count();
}

void from_json(const nlohmann::json& json, Timestamp& output)
{
	output = Timestamp{Timestamp::duration{json.get<Timestamp::duration::rep>()}};
}

std::ostream& operator<<(std::ostream& os, Timestamp tp)
{
	return os << tp.time_since_epoch().count();
}

Timestamp Timestamp::now()
{
	return time_point_cast<Timestamp::duration>(Timestamp::clock::now());
}

std::string Timestamp::iso8601() const
{
	auto tt = system_clock::to_time_t(time_point_cast<system_clock::duration>(*this));
	auto ms = time_since_epoch().count() % 1000;

	std::ostringstream ss;
	std::tm tm_{};
	if (auto tm = ::gmtime_r(&tt, &tm_); tm)
		ss << std::put_time(tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';

	return ss.str();
}

} // end of namespace imagio
