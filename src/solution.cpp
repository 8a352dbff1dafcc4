//
//  solution.cpp
//  mgmpc
//

#include <stdexcept>

#include "solution.hpp"
#include "config.hpp"
#include "misc.hpp"

/****************************************************************************
 * commit
 * - Appends the decision of _hour_. Hours must be committed in order,
 * without gaps.
 ****************************************************************************/
void CommittedSchedule::commit(int hour, const DispatchDecision &decision, double objValue) {
	if ( !rows.empty() && hour != rows.back().hour + 1 )
		throw logic_error("hour " + numToStr(hour) + " committed after hour " + numToStr(rows.back().hour));

	CommittedHour row;
	row.hour = hour;
	row.decision = decision;
	row.objValue = objValue;
	rows.push_back(row);
}

int CommittedSchedule::firstHour() const {
	if ( rows.empty() )
		throw logic_error("empty schedule has no first hour");
	return rows.front().hour;
}

int CommittedSchedule::lastHour() const {
	if ( rows.empty() )
		throw logic_error("empty schedule has no last hour");
	return rows.back().hour;
}

double CommittedSchedule::lastSoc() const {
	if ( rows.empty() )
		throw logic_error("empty schedule has no storage level");
	return rows.back().decision.soc;
}

static void printHeader (ofstream &output) {
	output << "hour,p_import_mw,p_export_mw,p_ely_mw,p_fc_mw,p_dg_mw,p_curt_mw,soc_mwh,objective_eur" << endl;
}

static void printRow (ofstream &output, int hour, const DispatchDecision &d, double objValue) {
	output << hour << delimiter
		   << setprecision(6) << fixed
		   << d.pImport << delimiter << d.pExport << delimiter << d.pEly << delimiter << d.pFc << delimiter
		   << d.pDg << delimiter << d.pCurt << delimiter << d.soc << delimiter << objValue << endl;
}

/****************************************************************************
 * printSchedule
 * - Writes one row per committed hour. The column set is read by the
 * reporting tools and must not change.
 ****************************************************************************/
bool printSchedule (string filepath, const CommittedSchedule &schedule) {
	ofstream output;
	if ( !open_file(output, filepath) )
		return false;

	printHeader(output);
	for (int k=0; k<schedule.size(); k++)
		printRow(output, schedule[k].hour, schedule[k].decision, schedule[k].objValue);

	output.close();
	return true;
}

/* Writes every hour of a single horizon plan in the schedule format */
bool printHorizonPlan (string filepath, const HorizonResult &result) {
	ofstream output;
	if ( !open_file(output, filepath) )
		return false;

	printHeader(output);
	for (unsigned int t=0; t<result.dispatch.size(); t++)
		printRow(output, result.beginHour + t, result.dispatch[t], result.objValue);

	output.close();
	return true;
}
