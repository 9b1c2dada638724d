/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 3/11/24.
//

#include "FileStorage.hh"

#include "common/Error.hh"
#include "common/crypto/Random.hh"
#include "common/util/Escape.hh"
#include "common/util/Log.hh"
#include "util/Configuration.hh"

#include <boost/beast/core/file.hpp>
#include <boost/exception/info.hpp>


namespace imagio {

FileStorage::FileStorage(fs::path root) : m_root{std::move(root)}
{
	if (!m_root.is_absolute())
		BOOST_THROW_EXCEPTION(Configuration::InvalidValue()
			<< Configuration::Path{m_root}
			<< Configuration::Message{"storage root must be an absolute path"}
		);
}

std::string FileStorage::name() const
{
	return "file://" + m_root.string();
}

fs::path FileStorage::path(std::string_view key, std::error_code& ec) const
{
	fs::path rel{std::string{key}};
	if (key.empty() || rel.has_root_path())
	{
		ec = Error::backend_error;
		return {};
	}

	for (auto&& component : rel)
	{
		if (component == "..")
		{
			ec = Error::backend_error;
			return {};
		}
	}

	ec.clear();
	return m_root / rel;
}

Blob FileStorage::read(std::string_view key, std::error_code& ec) const
{
	auto file_path = path(key, ec);
	if (ec)
	{
		Log(LOG_WARNING, "FileStorage::read(): invalid key \"%1%\"", key);
		return {};
	}

	boost::system::error_code bec;
	boost::beast::file file;
	file.open(file_path.string().c_str(), boost::beast::file_mode::scan, bec);
	if (bec == boost::system::errc::no_such_file_or_directory)
	{
		ec = Error::object_not_exist;
		return {};
	}

	Blob result;
	if (!bec)
	{
		auto size = file.size(bec);
		if (!bec)
		{
			result.resize(static_cast<std::size_t>(size));
			auto count = file.read(result.data(), result.size(), bec);
			if (!bec && count != result.size())
				bec = boost::system::errc::make_error_code(boost::system::errc::io_error);
		}
	}

	if (bec)
	{
		Log(LOG_WARNING, "FileStorage::read(): cannot read file %1% (%2% %3%)", file_path, bec, bec.message());
		ec = Error::backend_error;
		return {};
	}

	ec.clear();
	return result;
}

void FileStorage::write(std::string_view key, BufferView blob, std::error_code& ec) const
{
	auto dest = path(key, ec);
	if (ec)
	{
		Log(LOG_WARNING, "FileStorage::write(): invalid key \"%1%\"", key);
		return;
	}

	fs::create_directories(dest.parent_path(), ec);
	if (ec)
	{
		Log(LOG_WARNING, "FileStorage::write(): cannot create directory %1% (%2% %3%)", dest.parent_path(), ec, ec.message());
		ec = Error::backend_error;
		return;
	}

	// Concurrent writers of the same key each write to their own temporary file.
	// The last rename() wins.
	auto tmp = dest.parent_path() /
		("." + dest.filename().string() + "." + to_hex(secure_random_array<unsigned char, 8>()) + ".tmp");

	boost::system::error_code bec;
	{
		boost::beast::file file;
		file.open(tmp.string().c_str(), boost::beast::file_mode::write, bec);
		if (!bec && !blob.empty())
		{
			auto count = file.write(blob.data(), blob.size(), bec);
			if (!bec && count != blob.size())
				bec = boost::system::errc::make_error_code(boost::system::errc::io_error);
		}
		if (!bec)
			file.close(bec);
	}

	if (!bec)
	{
		fs::rename(tmp, dest, ec);
		if (ec)
			bec.assign(ec.value(), boost::system::generic_category());
	}

	if (bec)
	{
		Log(LOG_WARNING, "FileStorage::write(): cannot write to file %1% (%2% %3%)", dest, bec, bec.message());

		std::error_code rm_ec;
		fs::remove(tmp, rm_ec);

		ec = Error::backend_error;
	}
	else
		ec.clear();
}

bool FileStorage::exists(std::string_view key, std::error_code& ec) const
{
	auto file_path = path(key, ec);
	if (ec)
	{
		Log(LOG_WARNING, "FileStorage::exists(): invalid key \"%1%\"", key);
		return false;
	}

	boost::system::error_code bec;
	auto st = fs::status(file_path, bec);

	// a missing file or a missing parent directory both mean absent
	if (st.type() == fs::file_not_found ||
		bec == boost::system::errc::no_such_file_or_directory ||
		bec == boost::system::errc::not_a_directory)
		return false;

	if (bec)
	{
		Log(LOG_WARNING, "FileStorage::exists(): cannot stat %1% (%2% %3%)", file_path, bec, bec.message());
		ec = Error::backend_error;
		return false;
	}
	return fs::is_regular_file(st);
}

void FileStorage::remove(std::string_view key, std::error_code& ec) const
{
	auto file_path = path(key, ec);
	if (ec)
	{
		Log(LOG_WARNING, "FileStorage::remove(): invalid key \"%1%\"", key);
		return;
	}

	auto removed = fs::remove(file_path, ec);
	if (ec)
	{
		Log(LOG_WARNING, "FileStorage::remove(): cannot remove %1% (%2% %3%)", file_path, ec, ec.message());
		ec = Error::backend_error;
	}
	else if (!removed)
		ec = Error::object_not_exist;
}

} // end of namespace imagio
