/*

Copyright (c) 2003-2020, Arvid Norberg
Copyright (c) 2016-2017, Alden Torres
Copyright (c) 2017, Steven Siloti
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "pieceproof/config.hpp"
#include "pieceproof/aux_/path.hpp"
#include "pieceproof/aux_/throw.hpp"
#include "pieceproof/assert.hpp"

#include <cstdio>
#include <cstdlib>
#include <memory>

#include <sys/stat.h>
#include <sys/types.h>
#include <dirent.h>
#include <unistd.h>
#include <errno.h>

namespace pieceproof::aux {

namespace {

	struct free_function
	{
		void operator()(void* ptr) const noexcept { std::free(ptr); }
	};

	template <typename T>
	std::unique_ptr<T, free_function> make_free_holder(T* ptr)
	{
		return std::unique_ptr<T, free_function>(ptr, free_function{});
	}

	struct dir_closer
	{
		void operator()(DIR* d) const noexcept { ::closedir(d); }
	};
}

	void stat_file(std::string const& f, file_status* s
		, error_code& ec, int const flags)
	{
		ec.clear();

		struct ::stat ret{};
		int retval;
		if (flags & dont_follow_links)
			retval = ::lstat(f.c_str(), &ret);
		else
			retval = ::stat(f.c_str(), &ret);
		if (retval < 0)
		{
			ec.assign(errno, system_category());
			return;
		}

		// make sure the _FILE_OFFSET_BITS define worked
		// on this platform. It's supposed to make file
		// related functions support 64-bit offsets.
		static_assert(sizeof(ret.st_size) >= 8, "64 bit file operations are required");

		s->file_size = ret.st_size;

		s->mode = (S_ISREG(ret.st_mode) ? file_status::regular_file : 0)
			| (S_ISDIR(ret.st_mode) ? file_status::directory : 0);
	}

	void create_directories(std::string const& f, error_code& ec)
	{
		ec.clear();
		if (is_directory(f, ec)) return;
		if (ec != boost::system::errc::no_such_file_or_directory)
			return;
		ec.clear();
		if (is_root_path(f))
		{
			// this is just to set ec correctly, in case this root path isn't
			// mounted
			file_status s;
			stat_file(f, &s, ec);
			return;
		}
		if (has_parent_path(f))
		{
			create_directories(parent_path(f), ec);
			if (ec) return;
		}
		create_directory(f, ec);
	}

	void create_directory(std::string const& f, error_code& ec)
	{
		ec.clear();
		int const ret = ::mkdir(f.c_str(), S_IRWXU | S_IRWXG | S_IRWXO);
		if (ret < 0 && errno != EEXIST)
			ec.assign(errno, system_category());
	}

	bool is_directory(std::string const& f, error_code& ec)
	{
		ec.clear();
		error_code e;
		file_status s;
		stat_file(f, &s, e);
		if (!e && s.mode & file_status::directory) return true;
		ec = e;
		return false;
	}

	bool exists(std::string const& f, error_code& ec)
	{
		file_status s;
		stat_file(f, &s, ec);
		if (ec)
		{
			if (ec == boost::system::errc::no_such_file_or_directory)
				ec.clear();
			return false;
		}
		return true;
	}

	bool exists(std::string const& f)
	{
		error_code ec;
		return exists(f, ec);
	}

	void remove(std::string const& f, error_code& ec)
	{
		ec.clear();
		if (::remove(f.c_str()) < 0)
			ec.assign(errno, system_category());
	}

	void remove_all(std::string const& f, error_code& ec)
	{
		ec.clear();

		file_status s;
		stat_file(f, &s, ec, dont_follow_links);
		if (ec) return;

		if (s.mode & file_status::directory)
		{
			std::unique_ptr<DIR, dir_closer> dir(::opendir(f.c_str()));
			if (!dir)
			{
				ec.assign(errno, system_category());
				return;
			}
			while (dirent* de = ::readdir(dir.get()))
			{
				std::string const p = de->d_name;
				if (p == "." || p == "..") continue;
				remove_all(combine_path(f, p), ec);
				if (ec) return;
			}
		}
		remove(f, ec);
	}

	bool is_root_path(std::string const& f)
	{
		// as well as parent_path("/") should be "/".
		return f == "/";
	}

	bool has_parent_path(std::string const& f)
	{
		if (f.empty()) return false;
		if (is_root_path(f)) return false;

		int len = int(f.size()) - 1;
		// if the last character is / ignore it
		if (f[std::size_t(len)] == '/') --len;
		while (len >= 0)
		{
			if (f[std::size_t(len)] == '/')
				break;
			--len;
		}

		return len >= 0;
	}

	std::string parent_path(std::string const& f)
	{
		if (f.empty()) return f;
		if (f == "/") return "";

		int len = int(f.size());
		// if the last character is / ignore it
		if (f[std::size_t(len - 1)] == '/') --len;
		while (len > 0)
		{
			--len;
			if (f[std::size_t(len)] == '/')
				break;
		}

		if (f[std::size_t(len)] == '/') ++len;
		return std::string(f.c_str(), std::size_t(len));
	}

	void append_path(std::string& branch, std::string_view leaf)
	{
		PIECEPROOF_ASSERT(!is_complete(leaf));
		if (branch.empty() || branch == ".")
		{
			branch.assign(leaf.data(), leaf.size());
			return;
		}
		if (leaf.empty()) return;

		if (branch[branch.size() - 1] != '/') branch += '/';
		branch.append(leaf.data(), leaf.size());
	}

	std::string combine_path(std::string_view lhs, std::string_view rhs)
	{
		PIECEPROOF_ASSERT(!is_complete(rhs));
		if (lhs.empty() || lhs == ".") return std::string(rhs);
		if (rhs.empty() || rhs == ".") return std::string(lhs);

		std::string ret(lhs);
		if (ret[ret.size() - 1] != '/') ret += '/';
		ret.append(rhs.data(), rhs.size());
		return ret;
	}

	bool is_complete(std::string_view f)
	{
		if (f.empty()) return false;
		return f[0] == '/';
	}

	std::string current_working_directory()
	{
		auto cwd = ::getcwd(nullptr, 0);
		if (cwd == nullptr)
			aux::throw_ex<system_error>(error_code(errno, generic_category()));
		auto holder = make_free_holder(cwd);
		return std::string(cwd);
	}

	void change_directory(std::string const& f, error_code& ec)
	{
		ec.clear();
		if (::chdir(f.c_str()) != 0)
			ec.assign(errno, system_category());
	}
}
