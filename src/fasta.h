/*
 * Copyright (C) 2008-2019 Kengo Sato
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 59 Temple Place - Suite 330, Boston, MA 02111-1307, USA.
 */

#pragma once

#include <istream>
#include <string>
#include <vector>

// A named sequence. Plain text input yields one unnamed record holding
// the first line of the file.
class Fasta
{
public:
  Fasta() : name_(), seq_() { }

  Fasta(const std::string& name, const std::string& seq)
    : name_(name), seq_(seq)
  { }

  const std::string& name() const { return name_; }
  const std::string& seq() const { return seq_; }
  std::string& seq() { return seq_; }
  unsigned int size() const { return seq_.size(); }

  static
  std::vector<Fasta> load(const char* file);

  static
  std::vector<Fasta> load(const std::string& file) { return load(file.c_str()); };

  static
  std::vector<Fasta> read(std::istream& is);

private:
  std::string name_;
  std::string seq_;
};

