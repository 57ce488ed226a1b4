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

#include "fasta.h"
#include <fstream>
#include <string>
#include <cctype>
#include <cstring>
#include <cerrno>
#include <stdexcept>

typedef unsigned int uint;

static
std::string
chomp(std::string line)
{
  while (!line.empty() && (line.back()=='\n' || line.back()=='\r'))
    line.pop_back();
  return line;
}

//static
std::vector<Fasta>
Fasta::
load(const char* file)
{
  std::ifstream ifs(file);
  if (!ifs) throw std::runtime_error(std::string(strerror(errno)) + ": " + std::string(file));
  return read(ifs);
}

//static
std::vector<Fasta>
Fasta::
read(std::istream& is)
{
  std::vector<Fasta> data;
  std::string line, name, seq;

  if (!std::getline(is, line))  // empty input is an empty sequence
  {
    data.emplace_back("", "");
    return data;
  }
  line = chomp(line);
  if (line.empty() || line[0]!='>') // plain text, first line only
  {
    data.emplace_back("", line);
    return data;
  }

  bool in_record = false;
  do {
    line = chomp(line);
    if (!line.empty() && line[0]=='>') {         // header
      if (in_record)
        data.emplace_back(name, seq);
      name=line.substr(1);
      seq.clear();
      in_record = true;
      continue;
    }

    uint i;
    for (i=0; i!=line.size(); ++i)
      if (std::isspace(static_cast<unsigned char>(line[i]))) break;
    seq+=line.substr(0, i);
  } while (std::getline(is, line));

  if (in_record)
    data.emplace_back(name, seq);

  return data;
}
