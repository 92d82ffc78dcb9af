#ifndef TREEIO_H
#define TREEIO_H

#include "coalescent/Genealogy.hpp"

#include <iostream>
#include <string>

/** Export of genealogies for external rendering and analysis. */
namespace treeio {

/** Write genealogy as rooted tree in Newick format.
 *  Tips are labelled by individual index, branch lengths are times.
 */
void printNewick(const coalescent::Genealogy& genealogy, std::ostream& os);
void printNewick(const coalescent::Genealogy& genealogy, const std::string filename);
/** Write ancestry graph in DOT format (edge labels are edge weights). */
void printDot(const coalescent::Genealogy& genealogy, std::ostream& os);
void printDot(const coalescent::Genealogy& genealogy, const std::string filename);
/** Write number of lineages over time as CSV (columns: time, lineages). */
void writeLineageCounts(const coalescent::Genealogy& genealogy, std::ostream& os);
void writeLineageCounts(const coalescent::Genealogy& genealogy, const std::string filename);
/** Write lineage trajectories as CSV: one row per event time,
 *  one column per individual holding its lineage representative.
 */
void writeTrajectories(const coalescent::Genealogy& genealogy, std::ostream& os);
void writeTrajectories(const coalescent::Genealogy& genealogy, const std::string filename);

} // namespace treeio

#endif /* TREEIO_H */
