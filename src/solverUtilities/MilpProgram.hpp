//
//  MilpProgram.hpp
//  mgmpc
//

#ifndef MilpProgram_hpp
#define MilpProgram_hpp

#include <string>
#include <utility>
#include <vector>

using namespace std;

enum VarType {
	CONTINUOUS,
	BINARY
};

enum RowSense {
	ROW_EQ,
	ROW_LE,
	ROW_GE
};

struct MilpVar {
	string	name;
	double	lb, ub;		// bounds; +/-MilpInfinity for free directions
	double	obj;		// objective coefficient
	VarType	type;
};

struct MilpRow {
	string	name;
	vector<int>		idx;	// variable indices
	vector<double>	coef;	// matching coefficients
	RowSense sense;
	double	rhs;
};

/* Backend-neutral minimization program: min c'x s.t. rows, bounds, integrality */
class MilpProgram {

public:
	MilpProgram ();

	int		addVar (const string &name, double lb, double ub, double obj, VarType type);
	int		addRow (const string &name, const vector< pair<int,double> > &terms, RowSense sense, double rhs);

	int		numVars () const	{ return (int) vars.size(); }
	int		numRows () const	{ return (int) rows.size(); }
	int		numBinaries () const;

	const MilpVar&	var (int j) const	{ return vars[j]; }
	const MilpRow&	row (int i) const	{ return rows[i]; }

	double	objective (const vector<double> &x) const;
	double	maxViolation (const vector<double> &x) const;	// worst row or bound violation of _x_

private:
	vector<MilpVar> vars;
	vector<MilpRow> rows;
};

#endif /* MilpProgram_hpp */
