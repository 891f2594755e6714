/*

Copyright (c) 2003-2020, Arvid Norberg
Copyright (c) 2016-2017, Alden Torres
Copyright (c) 2017, Steven Siloti
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "pieceproof/config.hpp"
#include "pieceproof/aux_/file.hpp"
#include "pieceproof/aux_/throw.hpp"

#include <boost/asio/error.hpp>

#include <sys/stat.h>
#include <errno.h>

namespace pieceproof {
namespace aux {

	int pread_all(handle_type const handle
		, span<char> buf
		, std::int64_t file_offset
		, error_code& ec)
	{
		int ret = 0;
		do {
			auto const r = ::pread(handle, buf.data(), std::size_t(buf.size()), file_offset);
			if (r == 0)
			{
				ec = boost::asio::error::eof;
				return ret;
			}
			if (r < 0)
			{
				if (errno == EINTR) continue;
				ec = error_code(errno, system_category());
				return ret;
			}
			ret += int(r);
			file_offset += r;
			buf = buf.subspan(r);
		} while (buf.size() > 0);
		return ret;
	}

namespace {

	handle_type open_file(std::string const& name)
	{
		handle_type ret;
		do {
			ret = ::open(name.c_str(), O_RDONLY
#ifdef O_CLOEXEC
				| O_CLOEXEC
#endif
				);
		} while (ret == invalid_handle && errno == EINTR);

		if (ret == invalid_handle)
			throw_ex<storage_error>(error_code(errno, system_category()), operation_t::file_open);
		return ret;
	}
}

file_handle::file_handle(std::string const& name)
	: m_fd(open_file(name))
{
#ifdef POSIX_FADV_SEQUENTIAL
	// the content is read front to back
	::posix_fadvise(m_fd, 0, 0, POSIX_FADV_SEQUENTIAL);
#endif
}

void file_handle::close()
{
	if (m_fd == invalid_handle) return;
	::close(m_fd);
	m_fd = invalid_handle;
}

file_handle::~file_handle() { close(); }

file_handle& file_handle::operator=(file_handle&& rhs) & noexcept
{
	if (&rhs == this) return *this;
	close();
	m_fd = rhs.m_fd;
	rhs.m_fd = invalid_handle;
	return *this;
}

std::int64_t file_handle::get_size() const
{
	struct ::stat fs;
	if (::fstat(fd(), &fs) != 0)
		throw_ex<storage_error>(error_code(errno, system_category()), operation_t::file_stat);
	return fs.st_size;
}

} // namespace aux
}
