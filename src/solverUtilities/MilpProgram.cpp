//
//  MilpProgram.cpp
//  mgmpc
//

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "MilpProgram.hpp"

MilpProgram::MilpProgram() {}

int MilpProgram::addVar(const string &name, double lb, double ub, double obj, VarType type) {
	if ( lb > ub )
		throw invalid_argument("variable " + name + " has lower bound above upper bound");

	MilpVar v;
	v.name = name;
	v.lb = lb;
	v.ub = ub;
	v.obj = obj;
	v.type = type;
	vars.push_back(v);

	return (int) vars.size() - 1;
}

int MilpProgram::addRow(const string &name, const vector< pair<int,double> > &terms, RowSense sense, double rhs) {
	MilpRow r;
	r.name = name;
	r.sense = sense;
	r.rhs = rhs;
	for (unsigned int k=0; k<terms.size(); k++) {
		if ( terms[k].first < 0 || terms[k].first >= numVars() )
			throw out_of_range("row " + name + " refers to an unknown variable");
		r.idx.push_back(terms[k].first);
		r.coef.push_back(terms[k].second);
	}
	rows.push_back(r);

	return (int) rows.size() - 1;
}

int MilpProgram::numBinaries() const {
	int cnt = 0;
	for (unsigned int j=0; j<vars.size(); j++)
		if ( vars[j].type == BINARY )	cnt++;
	return cnt;
}

double MilpProgram::objective(const vector<double> &x) const {
	double val = 0;
	for (unsigned int j=0; j<vars.size(); j++)
		val += vars[j].obj * x[j];
	return val;
}

double MilpProgram::maxViolation(const vector<double> &x) const {
	double worst = 0;

	for (unsigned int j=0; j<vars.size(); j++) {
		worst = max(worst, vars[j].lb - x[j]);
		worst = max(worst, x[j] - vars[j].ub);
	}

	for (unsigned int i=0; i<rows.size(); i++) {
		double lhs = 0;
		for (unsigned int k=0; k<rows[i].idx.size(); k++)
			lhs += rows[i].coef[k] * x[rows[i].idx[k]];

		switch (rows[i].sense) {
		case ROW_EQ:	worst = max(worst, fabs(lhs - rows[i].rhs));	break;
		case ROW_LE:	worst = max(worst, lhs - rows[i].rhs);			break;
		case ROW_GE:	worst = max(worst, rows[i].rhs - lhs);			break;
		}
	}

	return worst;
}
