#ifndef DATAFRAME_H
#define DATAFRAME_H

#include "../stringio.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

/** Collection of useful data classes. */
namespace model {

/** Convert data element to string (fixed width, for display). */
template <typename T>
std::string data_to_str(const T data);

/** Convert data element to string (full precision, for files). */
template <typename T>
std::string data_to_csv(const T data);

/** A data matrix with named rows and columns. */
template <typename T>
struct DataFrame {
  /** Number of rows. */
  unsigned n_rows;
  /** Number of columns. */
  unsigned n_cols;
  /** Stores column names. */
  std::vector<std::string> colnames;
  /** Stores row names. */
  std::vector<std::string> rownames;
  /** Stores actual data. */
  std::vector<std::vector<T>> data;

  /** Default c'tor. */
  DataFrame ();

  /** C'tor from labels and a row-major data matrix. */
  DataFrame (
    const std::vector<std::string> cols,
    const std::vector<std::string> rows,
    const std::vector<std::vector<T>> d
  );

  /** Access data elements by label. */
  T at (
    const std::string lbl_row,
    const std::string lbl_col
  ) const
  {
    return this->data[_indexOf(rownames, lbl_row)][_indexOf(colnames, lbl_col)];
  }

  /** Access data elements by index. */
  T at (
    const unsigned idx_row,
    const unsigned idx_col
  ) const
  {
    // make sure indices are valid
    if ( idx_row >= this->n_rows || idx_col >= this->n_cols ) {
      throw std::out_of_range("DataFrame: index out of range");
    }

    return this->data[idx_row][idx_col];
  }

  /** Format as tab-separated table (for console output). */
  std::string to_string() const
  {
    std::string str;
    for (const std::string& lbl : colnames) {
      str += "\t" + lbl;
    }
    str += "\n";
    for (unsigned i=0; i<n_rows; i++) {
      str += rownames[i];
      for (const T& value : data[i]) {
        str += "\t" + data_to_str<T>(value);
      }
      str += "\n";
    }
    return str;
  }

  /** Write to file in CSV format (first column holds row names). */
  void writeCSV (
    const std::string filename,
    const char sep=','
  ) const
  {
    std::ofstream filestream;
    filestream.open(filename.c_str());
    if (!filestream.good()) {
      throw std::runtime_error("Could not open file '" + filename + "' for writing.");
    }
    for (auto lbl : colnames) {
      filestream << sep << lbl;
    }
    filestream << std::endl;
    for (unsigned i=0; i<n_rows; i++) {
      filestream << rownames[i];
      for (unsigned j=0; j<n_cols; j++) {
        filestream << sep << data_to_csv<T>(data[i][j]);
      }
      filestream << std::endl;
    }
    filestream.close();
  }

private:
  static unsigned _indexOf(const std::vector<std::string>& labels, const std::string& lbl) {
    auto it = std::find(labels.begin(), labels.end(), lbl);
    if (it == labels.end()) {
      throw std::out_of_range("DataFrame: unknown label '" + lbl + "'");
    }
    return unsigned(it - labels.begin());
  }
};

/* Method implementations */

template <>
inline std::string data_to_str<double>(const double value) {
  return stringio::format("%.4f", value);
}

template <>
inline std::string data_to_csv<double>(const double value) {
  return stringio::format("%.10g", value);
}

template <typename T>
DataFrame<T>::DataFrame ()
: n_rows(0), n_cols(0)
{}

template <typename T>
DataFrame<T>::DataFrame (
  const std::vector<std::string> cols,
  const std::vector<std::string> rows,
  const std::vector<std::vector<T>> d
)
: n_rows(rows.size()), n_cols(cols.size()), colnames(cols), rownames(rows), data(d)
{
  if (d.size() != rows.size()) {
    throw std::invalid_argument("DataFrame: number of rows does not match row labels");
  }
  for (auto row : d) {
    if (row.size() != cols.size()) {
      throw std::invalid_argument("DataFrame: number of columns does not match column labels");
    }
  }
}

} /* namespace model */

#endif /* DATAFRAME_H */
