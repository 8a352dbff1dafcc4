//
//  ScenarioTable.cpp
//  mgmpc
//

#include <map>

#include "ScenarioTable.hpp"
#include "../errors.hpp"
#include "../misc.hpp"

ScenarioTable::ScenarioTable() : firstHour(0) {}

void ScenarioTable::addHour(double load, double pv, double wind, double importPrice, double exportPrice) {
	this->load.push_back(load);
	this->pv.push_back(pv);
	this->wind.push_back(wind);
	this->importPrice.push_back(importPrice);
	this->exportPrice.push_back(exportPrice);
}

int ScenarioTable::numHours() const {
	return (int) load.size();
}

int ScenarioTable::lastHour() const {
	return firstHour + numHours() - 1;
}

bool ScenarioTable::hasHour(int hour) const {
	return hour >= firstHour && hour <= lastHour();
}

void ScenarioTable::check() const {
	if ( firstHour < 0 )
		throw InputShapeError("hour index must be non-negative");

	size_t n = load.size();
	if ( pv.size() != n || wind.size() != n || importPrice.size() != n || exportPrice.size() != n )
		throw InputShapeError("table columns have different lengths");
}

/****************************************************************************
 * window
 * - Copies hours [beginHour, beginHour+length) into a fresh window.
 * - Throws InputShapeError if the window does not fit in the table.
 ****************************************************************************/
ScenarioWindow ScenarioTable::window(int beginHour, int length, const SystemParams &sys) const {
	check();

	if ( length < 1 )
		throw InputShapeError("window length must be at least 1");
	if ( !hasHour(beginHour) || !hasHour(beginHour + length - 1) )
		throw InputShapeError("window [" + numToStr(beginHour) + ", " + numToStr(beginHour+length-1) +
							  "] extends past the available hours [" + numToStr(firstHour) + ", " + numToStr(lastHour()) + "]");

	int k0 = beginHour - firstHour;
	return ScenarioWindow(beginHour,
						  vector<double>(load.begin()+k0, load.begin()+k0+length),
						  vector<double>(pv.begin()+k0, pv.begin()+k0+length),
						  vector<double>(wind.begin()+k0, wind.begin()+k0+length),
						  vector<double>(importPrice.begin()+k0, importPrice.begin()+k0+length),
						  vector<double>(exportPrice.begin()+k0, exportPrice.begin()+k0+length),
						  sys);
}

double ScenarioTable::peakLoad() const {
	return maximum(load);
}

/* Rescales the load so that its peak equals _nominal_ MW. A table without positive load is left unchanged. */
void ScenarioTable::scaleLoadToNominal(double nominal) {
	double peak = peakLoad();
	double factor = (peak > 0) ? nominal / peak : 1.0;

	for (unsigned int k=0; k<load.size(); k++)
		load[k] *= factor;
}

/****************************************************************************
 * readScenarioTable
 * - Reads the hourly table from a csv file with a header row. The export
 * price column may be named after the wholesale price (pun).
 * - Hours must start at a non-negative index and follow without gaps.
 ****************************************************************************/
void readScenarioTable (string fname, ScenarioTable &table) {
	ifstream fptr;
	vector<string> tokens;
	string line;

	if ( !open_file(fptr, fname) )
		throw InputShapeError("cannot read the scenario table " + fname);

	/* column names */
	map<string, int> mapColNamesToIndex;
	safeGetline(fptr, line);
	tokens = splitString(line, delimiter);
	for (unsigned int n = 0; n < tokens.size(); n++)
		mapColNamesToIndex.insert( pair<string, int> (trimString(tokens[n]), n) );

	const char* required[] = {"hour", "load_forecast_mw", "pv_forecast_mw", "wind_forecast_mw", "import_price_eur_per_mwh"};
	vector<int> col;
	for (unsigned int i = 0; i < 5; i++) {
		auto it = mapColNamesToIndex.find(required[i]);
		if ( it == mapColNamesToIndex.end() )
			throw InputShapeError(fname + " has no column " + required[i]);
		col.push_back(it->second);
	}

	auto it = mapColNamesToIndex.find("export_price_eur_per_mwh");
	if ( it == mapColNamesToIndex.end() )
		it = mapColNamesToIndex.find("pun_eur_per_mwh");
	if ( it == mapColNamesToIndex.end() )
		throw InputShapeError(fname + " has no export price column");
	col.push_back(it->second);

	int maxCol = *max_element(col.begin(), col.end());

	/* data */
	table = ScenarioTable();
	int row = 0;
	while ( safeGetline(fptr, line) ) {
		if ( trimString(line).empty() )	continue;

		tokens = splitString(line, delimiter);
		if ( (int) tokens.size() <= maxCol )
			throw InputShapeError(fname + ": row " + numToStr(row+1) + " has " + numToStr(tokens.size()) + " fields");

		int hour = (int) round(atof(tokens[col[0]].c_str()));
		if ( row == 0 ) {
			if ( hour < 0 )
				throw InputShapeError(fname + ": hour index must be non-negative");
			table.firstHour = hour;
		}
		else if ( hour != table.firstHour + row ) {
			throw InputShapeError(fname + ": hour " + numToStr(hour) + " follows hour " + numToStr(table.firstHour + row - 1));
		}

		table.addHour(atof(tokens[col[1]].c_str()), atof(tokens[col[2]].c_str()), atof(tokens[col[3]].c_str()),
					  atof(tokens[col[4]].c_str()), atof(tokens[col[5]].c_str()));
		row++;
	}
	fptr.close();

	if ( row == 0 )
		throw InputShapeError(fname + " contains no hours");
}//END readScenarioTable()
